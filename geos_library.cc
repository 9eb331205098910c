// Copyright 2020 The Cockroach Authors.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#if _WIN32
#include <windows.h>
#else
#include <dlfcn.h>
#endif  // #if _WIN32
#include <memory>
#include <mutex>
#include <stdlib.h>
#include <string>

#include "geos_symbols.h"
#include "include/geoskit/logging.h"

#if _WIN32
#define dlopen(x, y) LoadLibrary(x)
#define dlsym GetProcAddress
#define dlclose FreeLibrary
#define dlerror() ((char*)"failed to execute dlsym")
typedef HMODULE dlhandle;
#else
typedef void* dlhandle;
#endif  // #if _WIN32

namespace geoskit {

namespace {

#if _WIN32
const char kDefaultGeosCLocation[] = "geos_c.dll";
const char kDefaultGeosLocation[] = "geos.dll";
#elif __APPLE__
const char kDefaultGeosCLocation[] = "libgeos_c.dylib";
const char kDefaultGeosLocation[] = "libgeos.dylib";
#else
const char kDefaultGeosCLocation[] = "libgeos_c.so.1";
const char kDefaultGeosLocation[] = "libgeos.so";
#endif

std::string EnvOr(const char* name, const char* fallback) {
  const char* value = getenv(name);
  if (value == nullptr || *value == '\0') {
    return fallback;
  }
  return value;
}

void CloseHandle(void* handle) {
  if (handle != nullptr) {
    dlclose(reinterpret_cast<dlhandle>(handle));
  }
}

Status LoadError(const std::string& what, const char* msg) {
  auto s = Status::LoadError(what + ": " + (msg != nullptr ? msg : "unknown error"));
  Logger()->error("geoskit: {}", s.message());
  return s;
}

}  // namespace

GeosLibrary::~GeosLibrary() {
  CloseHandle(geoscHandle);
  CloseHandle(geosHandle);
}

const char* GeosLibrary::Init() {
#define INIT(x)                                                                                    \
  do {                                                                                             \
    auto error = InitSym(&x, #x);                                                                  \
    if (error != nullptr) {                                                                        \
      return error;                                                                                \
    }                                                                                              \
  } while (0)

  INIT(GEOS_init_r);
  INIT(GEOS_finish_r);
  INIT(GEOSContext_setErrorMessageHandler_r);
  INIT(GEOSContext_setNoticeMessageHandler_r);
  INIT(GEOSFree_r);
  INIT(GEOSGeom_destroy_r);
  INIT(GEOSGeomTypeId_r);
  INIT(GEOSHasZ_r);
  INIT(GEOSCoordSeq_create_r);
  INIT(GEOSCoordSeq_destroy_r);
  INIT(GEOSCoordSeq_setXY_r);
  INIT(GEOSCoordSeq_setXYZ_r);
  INIT(GEOSCoordSeq_getXY_r);
  INIT(GEOSCoordSeq_getXYZ_r);
  INIT(GEOSCoordSeq_getSize_r);
  INIT(GEOSGeom_getCoordSeq_r);
  INIT(GEOSGeom_createPoint_r);
  INIT(GEOSGeom_createLineString_r);
  INIT(GEOSGeom_createLinearRing_r);
  INIT(GEOSGeom_createPolygon_r);
  INIT(GEOSGeom_createCollection_r);
  INIT(GEOSGetExteriorRing_r);
  INIT(GEOSGetNumInteriorRings_r);
  INIT(GEOSGetInteriorRingN_r);
  INIT(GEOSGetNumGeometries_r);
  INIT(GEOSGetGeometryN_r);
  INIT(GEOSArea_r);
  INIT(GEOSLength_r);
  INIT(GEOSDistance_r);
  INIT(GEOSHausdorffDistance_r);
  INIT(GEOSHausdorffDistanceDensify_r);
  INIT(GEOSNearestPoints_r);
  INIT(GEOSisEmpty_r);
  INIT(GEOSisRing_r);
  INIT(GEOSisValid_r);
  INIT(GEOSisValidReason_r);
  INIT(GEOSisValidDetail_r);
  INIT(GEOSEquals_r);
  INIT(GEOSDisjoint_r);
  INIT(GEOSTouches_r);
  INIT(GEOSIntersects_r);
  INIT(GEOSCrosses_r);
  INIT(GEOSWithin_r);
  INIT(GEOSContains_r);
  INIT(GEOSOverlaps_r);
  INIT(GEOSCovers_r);
  INIT(GEOSCoveredBy_r);
  INIT(GEOSRelatePattern_r);
  INIT(GEOSRelate_r);
  INIT(GEOSEnvelope_r);
  INIT(GEOSIntersection_r);
  INIT(GEOSDifference_r);
  INIT(GEOSSymDifference_r);
  INIT(GEOSUnion_r);
  INIT(GEOSUnaryUnion_r);
  INIT(GEOSConvexHull_r);
  INIT(GEOSConcaveHull_r);
  INIT(GEOSMinimumRotatedRectangle_r);
  INIT(GEOSMinimumWidth_r);
  INIT(GEOSPointOnSurface_r);
  INIT(GEOSGetCentroid_r);
  INIT(GEOSMinimumBoundingCircle_r);
  INIT(GEOSPolygonize_r);
  INIT(GEOSLineMerge_r);
  INIT(GEOSLineMergeDirected_r);
  INIT(GEOSSimplify_r);
  INIT(GEOSTopologyPreserveSimplify_r);
  INIT(GEOSSnap_r);
  INIT(GEOSNormalize_r);
  INIT(GEOSBuffer_r);
  INIT(GEOSBufferParams_create_r);
  INIT(GEOSBufferParams_destroy_r);
  INIT(GEOSBufferParams_setEndCapStyle_r);
  INIT(GEOSBufferParams_setJoinStyle_r);
  INIT(GEOSBufferParams_setMitreLimit_r);
  INIT(GEOSBufferParams_setQuadrantSegments_r);
  INIT(GEOSBufferWithParams_r);
  INIT(GEOSOffsetCurve_r);
  INIT(GEOSMakeValid_r);
  INIT(GEOSMakeValidParams_create_r);
  INIT(GEOSMakeValidParams_destroy_r);
  INIT(GEOSMakeValidParams_setMethod_r);
  INIT(GEOSMakeValidParams_setKeepCollapsed_r);
  INIT(GEOSMakeValidWithParams_r);
  INIT(GEOSPrepare_r);
  INIT(GEOSPreparedGeom_destroy_r);
  INIT(GEOSPreparedContains_r);
  INIT(GEOSPreparedContainsProperly_r);
  INIT(GEOSPreparedCoveredBy_r);
  INIT(GEOSPreparedCovers_r);
  INIT(GEOSPreparedCrosses_r);
  INIT(GEOSPreparedDisjoint_r);
  INIT(GEOSPreparedIntersects_r);
  INIT(GEOSPreparedOverlaps_r);
  INIT(GEOSPreparedTouches_r);
  INIT(GEOSPreparedWithin_r);
  return nullptr;

#undef INIT
}

template <typename T> const char* GeosLibrary::InitSym(T* ptr, const char* symbol) {
  *ptr = reinterpret_cast<T>(dlsym(reinterpret_cast<dlhandle>(geoscHandle), symbol));
  if (*ptr == nullptr) {
    return dlerror();
  }
  return nullptr;
}

LibraryOptions DefaultLibraryOptions() {
  LibraryOptions options;
  options.geosc_location = EnvOr("GEOSKIT_GEOSC_LIBRARY", kDefaultGeosCLocation);
  options.geos_location = EnvOr("GEOSKIT_GEOS_LIBRARY", kDefaultGeosLocation);
  return options;
}

Status OpenGeosLibrary(const LibraryOptions& options, GeosLibrary** lib) {
  // Open the libgeos.$(EXT) first, so that libgeos_c.$(EXT) can read it.
  dlhandle geosHandle = dlopen(options.geos_location.c_str(), RTLD_LAZY);
  if (!geosHandle) {
    return LoadError("opening " + options.geos_location, dlerror());
  }

  dlhandle geoscHandle = dlopen(options.geosc_location.c_str(), RTLD_LAZY);
  if (!geoscHandle) {
    auto s = LoadError("opening " + options.geosc_location, dlerror());
    dlclose(geosHandle);
    return s;
  }

  std::unique_ptr<GeosLibrary> ret(new GeosLibrary());
  ret->geoscHandle = reinterpret_cast<void*>(geoscHandle);
  ret->geosHandle = reinterpret_cast<void*>(geosHandle);
  auto initError = ret->Init();
  if (initError != nullptr) {
    // The destructor closes both handles.
    return LoadError("resolving symbols in " + options.geosc_location, initError);
  }

  Logger()->info("geoskit: loaded GEOS from {}", options.geosc_location);
  *lib = ret.release();
  return Status::OK();
}

void CloseGeosLibrary(GeosLibrary* lib) { delete lib; }

Status DefaultGeosLibrary(GeosLibrary** lib) {
  static std::once_flag once;
  static GeosLibrary* defaultLib = nullptr;
  static Status* defaultStatus = nullptr;
  std::call_once(once, [] {
    defaultStatus = new Status(OpenGeosLibrary(DefaultLibraryOptions(), &defaultLib));
  });
  if (defaultStatus->ok()) {
    *lib = defaultLib;
  }
  return *defaultStatus;
}

}  // namespace geoskit
