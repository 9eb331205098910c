// Copyright 2020 The Cockroach Authors.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#pragma once

#include <stddef.h>
#include "include/geoskit/library.h"

// Data Types adapted from `capi/geos_c.h.in` in GEOS.
typedef void* GEOSKIT_Handle;
typedef void* GEOSKIT_Geometry;
typedef void* GEOSKIT_CoordSeq;
typedef void* GEOSKIT_PreparedGeometry;
typedef void* GEOSKIT_BufferParams;
typedef void* GEOSKIT_MakeValidParams;
typedef void (*GEOSKIT_MessageHandler)(const char*, void*);

// Constants adapted from `capi/geos_c.h.in` in GEOS.
enum {
  GEOSKIT_POINT = 0,
  GEOSKIT_LINESTRING = 1,
  GEOSKIT_LINEARRING = 2,
  GEOSKIT_POLYGON = 3,
  GEOSKIT_MULTIPOINT = 4,
  GEOSKIT_MULTILINESTRING = 5,
  GEOSKIT_MULTIPOLYGON = 6,
  GEOSKIT_GEOMETRYCOLLECTION = 7,
};

enum {
  GEOSKIT_BUFFER_CAP_ROUND = 1,
  GEOSKIT_BUFFER_CAP_FLAT = 2,
  GEOSKIT_BUFFER_CAP_SQUARE = 3,
};

enum {
  GEOSKIT_BUFFER_JOIN_ROUND = 1,
  GEOSKIT_BUFFER_JOIN_MITRE = 2,
  GEOSKIT_BUFFER_JOIN_BEVEL = 3,
};

enum {
  GEOSKIT_MAKE_VALID_LINEWORK = 0,
  GEOSKIT_MAKE_VALID_STRUCTURE = 1,
};

enum {
  GEOSKIT_VALID_ALLOW_SELFTOUCHING_RING_FORMING_HOLE = 1,
};

// Function declarations from `capi/geos_c.h.in` in GEOS.
typedef GEOSKIT_Handle (*GEOSKIT_init_r)();
typedef void (*GEOSKIT_finish_r)(GEOSKIT_Handle);
typedef GEOSKIT_MessageHandler (*GEOSKIT_Context_setMessageHandler_r)(GEOSKIT_Handle,
                                                                      GEOSKIT_MessageHandler,
                                                                      void*);
typedef void (*GEOSKIT_Free_r)(GEOSKIT_Handle, void* buffer);
typedef void (*GEOSKIT_GeomDestroy_r)(GEOSKIT_Handle, GEOSKIT_Geometry);
typedef int (*GEOSKIT_GeomTypeId_r)(GEOSKIT_Handle, GEOSKIT_Geometry);
typedef char (*GEOSKIT_UnaryPredicate_r)(GEOSKIT_Handle, GEOSKIT_Geometry);
typedef char (*GEOSKIT_BinaryPredicate_r)(GEOSKIT_Handle, GEOSKIT_Geometry, GEOSKIT_Geometry);

typedef GEOSKIT_CoordSeq (*GEOSKIT_CoordSeq_create_r)(GEOSKIT_Handle, unsigned int size,
                                                      unsigned int dims);
typedef void (*GEOSKIT_CoordSeq_destroy_r)(GEOSKIT_Handle, GEOSKIT_CoordSeq);
typedef int (*GEOSKIT_CoordSeq_setXY_r)(GEOSKIT_Handle, GEOSKIT_CoordSeq, unsigned int idx,
                                        double x, double y);
typedef int (*GEOSKIT_CoordSeq_setXYZ_r)(GEOSKIT_Handle, GEOSKIT_CoordSeq, unsigned int idx,
                                         double x, double y, double z);
typedef int (*GEOSKIT_CoordSeq_getXY_r)(GEOSKIT_Handle, GEOSKIT_CoordSeq, unsigned int idx,
                                        double* x, double* y);
typedef int (*GEOSKIT_CoordSeq_getXYZ_r)(GEOSKIT_Handle, GEOSKIT_CoordSeq, unsigned int idx,
                                         double* x, double* y, double* z);
typedef int (*GEOSKIT_CoordSeq_getSize_r)(GEOSKIT_Handle, GEOSKIT_CoordSeq, unsigned int* size);
typedef GEOSKIT_CoordSeq (*GEOSKIT_Geom_getCoordSeq_r)(GEOSKIT_Handle, GEOSKIT_Geometry);

typedef GEOSKIT_Geometry (*GEOSKIT_Geom_createFromCoordSeq_r)(GEOSKIT_Handle, GEOSKIT_CoordSeq);
typedef GEOSKIT_Geometry (*GEOSKIT_Geom_createPolygon_r)(GEOSKIT_Handle, GEOSKIT_Geometry shell,
                                                         GEOSKIT_Geometry* holes,
                                                         unsigned int nholes);
typedef GEOSKIT_Geometry (*GEOSKIT_Geom_createCollection_r)(GEOSKIT_Handle, int type,
                                                            GEOSKIT_Geometry* geoms,
                                                            unsigned int ngeoms);

typedef GEOSKIT_Geometry (*GEOSKIT_GetExteriorRing_r)(GEOSKIT_Handle, GEOSKIT_Geometry);
typedef int (*GEOSKIT_GetNumInteriorRings_r)(GEOSKIT_Handle, GEOSKIT_Geometry);
typedef GEOSKIT_Geometry (*GEOSKIT_GetInteriorRingN_r)(GEOSKIT_Handle, GEOSKIT_Geometry, int n);
typedef int (*GEOSKIT_GetNumGeometries_r)(GEOSKIT_Handle, GEOSKIT_Geometry);
typedef GEOSKIT_Geometry (*GEOSKIT_GetGeometryN_r)(GEOSKIT_Handle, GEOSKIT_Geometry, int n);

typedef int (*GEOSKIT_Measure_r)(GEOSKIT_Handle, GEOSKIT_Geometry, double*);
typedef int (*GEOSKIT_Distance_r)(GEOSKIT_Handle, GEOSKIT_Geometry, GEOSKIT_Geometry, double*);
typedef int (*GEOSKIT_DistanceDensify_r)(GEOSKIT_Handle, GEOSKIT_Geometry, GEOSKIT_Geometry,
                                         double densifyFrac, double*);
typedef GEOSKIT_CoordSeq (*GEOSKIT_NearestPoints_r)(GEOSKIT_Handle, GEOSKIT_Geometry,
                                                    GEOSKIT_Geometry);

typedef char* (*GEOSKIT_isValidReason_r)(GEOSKIT_Handle, GEOSKIT_Geometry);
typedef char (*GEOSKIT_isValidDetail_r)(GEOSKIT_Handle, GEOSKIT_Geometry, int flags,
                                        char** reason, GEOSKIT_Geometry* location);

typedef char (*GEOSKIT_RelatePattern_r)(GEOSKIT_Handle, GEOSKIT_Geometry, GEOSKIT_Geometry,
                                        const char* pattern);
typedef char* (*GEOSKIT_Relate_r)(GEOSKIT_Handle, GEOSKIT_Geometry, GEOSKIT_Geometry);

typedef GEOSKIT_Geometry (*GEOSKIT_UnaryOperator_r)(GEOSKIT_Handle, GEOSKIT_Geometry);
typedef GEOSKIT_Geometry (*GEOSKIT_BinaryOperator_r)(GEOSKIT_Handle, GEOSKIT_Geometry,
                                                     GEOSKIT_Geometry);
typedef GEOSKIT_Geometry (*GEOSKIT_ToleranceOperator_r)(GEOSKIT_Handle, GEOSKIT_Geometry,
                                                        double tolerance);
typedef GEOSKIT_Geometry (*GEOSKIT_ConcaveHull_r)(GEOSKIT_Handle, GEOSKIT_Geometry, double ratio,
                                                  unsigned int allowHoles);
typedef GEOSKIT_Geometry (*GEOSKIT_MinimumBoundingCircle_r)(GEOSKIT_Handle, GEOSKIT_Geometry,
                                                            double* radius,
                                                            GEOSKIT_Geometry* center);
typedef GEOSKIT_Geometry (*GEOSKIT_Polygonize_r)(GEOSKIT_Handle, const GEOSKIT_Geometry* geoms,
                                                 unsigned int ngeoms);
typedef GEOSKIT_Geometry (*GEOSKIT_Snap_r)(GEOSKIT_Handle, GEOSKIT_Geometry, GEOSKIT_Geometry,
                                           double tolerance);
typedef int (*GEOSKIT_Normalize_r)(GEOSKIT_Handle, GEOSKIT_Geometry);

typedef GEOSKIT_Geometry (*GEOSKIT_Buffer_r)(GEOSKIT_Handle, GEOSKIT_Geometry, double width,
                                             int quadsegs);
typedef GEOSKIT_BufferParams (*GEOSKIT_BufferParams_create_r)(GEOSKIT_Handle);
typedef void (*GEOSKIT_BufferParams_destroy_r)(GEOSKIT_Handle, GEOSKIT_BufferParams);
typedef int (*GEOSKIT_BufferParams_setStyle_r)(GEOSKIT_Handle, GEOSKIT_BufferParams, int style);
typedef int (*GEOSKIT_BufferParams_setMitreLimit_r)(GEOSKIT_Handle, GEOSKIT_BufferParams,
                                                    double mitreLimit);
typedef GEOSKIT_Geometry (*GEOSKIT_BufferWithParams_r)(GEOSKIT_Handle, GEOSKIT_Geometry,
                                                       GEOSKIT_BufferParams, double width);
typedef GEOSKIT_Geometry (*GEOSKIT_OffsetCurve_r)(GEOSKIT_Handle, GEOSKIT_Geometry, double width,
                                                  int quadsegs, int joinStyle,
                                                  double mitreLimit);

typedef GEOSKIT_MakeValidParams (*GEOSKIT_MakeValidParams_create_r)(GEOSKIT_Handle);
typedef void (*GEOSKIT_MakeValidParams_destroy_r)(GEOSKIT_Handle, GEOSKIT_MakeValidParams);
typedef int (*GEOSKIT_MakeValidParams_setInt_r)(GEOSKIT_Handle, GEOSKIT_MakeValidParams, int);
typedef GEOSKIT_Geometry (*GEOSKIT_MakeValidWithParams_r)(GEOSKIT_Handle, GEOSKIT_Geometry,
                                                          GEOSKIT_MakeValidParams);

typedef GEOSKIT_PreparedGeometry (*GEOSKIT_Prepare_r)(GEOSKIT_Handle, GEOSKIT_Geometry);
typedef void (*GEOSKIT_PreparedGeom_destroy_r)(GEOSKIT_Handle, GEOSKIT_PreparedGeometry);
typedef char (*GEOSKIT_PreparedPredicate_r)(GEOSKIT_Handle, GEOSKIT_PreparedGeometry,
                                            GEOSKIT_Geometry);

namespace geoskit {

struct GeosLibrary {
  // Shared library handles; null for a table not loaded from disk.
  void* geoscHandle;
  void* geosHandle;

  GEOSKIT_init_r GEOS_init_r;
  GEOSKIT_finish_r GEOS_finish_r;
  GEOSKIT_Context_setMessageHandler_r GEOSContext_setErrorMessageHandler_r;
  GEOSKIT_Context_setMessageHandler_r GEOSContext_setNoticeMessageHandler_r;
  GEOSKIT_Free_r GEOSFree_r;

  GEOSKIT_GeomDestroy_r GEOSGeom_destroy_r;
  GEOSKIT_GeomTypeId_r GEOSGeomTypeId_r;
  GEOSKIT_UnaryPredicate_r GEOSHasZ_r;

  GEOSKIT_CoordSeq_create_r GEOSCoordSeq_create_r;
  GEOSKIT_CoordSeq_destroy_r GEOSCoordSeq_destroy_r;
  GEOSKIT_CoordSeq_setXY_r GEOSCoordSeq_setXY_r;
  GEOSKIT_CoordSeq_setXYZ_r GEOSCoordSeq_setXYZ_r;
  GEOSKIT_CoordSeq_getXY_r GEOSCoordSeq_getXY_r;
  GEOSKIT_CoordSeq_getXYZ_r GEOSCoordSeq_getXYZ_r;
  GEOSKIT_CoordSeq_getSize_r GEOSCoordSeq_getSize_r;
  GEOSKIT_Geom_getCoordSeq_r GEOSGeom_getCoordSeq_r;

  GEOSKIT_Geom_createFromCoordSeq_r GEOSGeom_createPoint_r;
  GEOSKIT_Geom_createFromCoordSeq_r GEOSGeom_createLineString_r;
  GEOSKIT_Geom_createFromCoordSeq_r GEOSGeom_createLinearRing_r;
  GEOSKIT_Geom_createPolygon_r GEOSGeom_createPolygon_r;
  GEOSKIT_Geom_createCollection_r GEOSGeom_createCollection_r;

  GEOSKIT_GetExteriorRing_r GEOSGetExteriorRing_r;
  GEOSKIT_GetNumInteriorRings_r GEOSGetNumInteriorRings_r;
  GEOSKIT_GetInteriorRingN_r GEOSGetInteriorRingN_r;
  GEOSKIT_GetNumGeometries_r GEOSGetNumGeometries_r;
  GEOSKIT_GetGeometryN_r GEOSGetGeometryN_r;

  GEOSKIT_Measure_r GEOSArea_r;
  GEOSKIT_Measure_r GEOSLength_r;
  GEOSKIT_Distance_r GEOSDistance_r;
  GEOSKIT_Distance_r GEOSHausdorffDistance_r;
  GEOSKIT_DistanceDensify_r GEOSHausdorffDistanceDensify_r;
  GEOSKIT_NearestPoints_r GEOSNearestPoints_r;

  GEOSKIT_UnaryPredicate_r GEOSisEmpty_r;
  GEOSKIT_UnaryPredicate_r GEOSisRing_r;
  GEOSKIT_UnaryPredicate_r GEOSisValid_r;
  GEOSKIT_isValidReason_r GEOSisValidReason_r;
  GEOSKIT_isValidDetail_r GEOSisValidDetail_r;

  GEOSKIT_BinaryPredicate_r GEOSEquals_r;
  GEOSKIT_BinaryPredicate_r GEOSDisjoint_r;
  GEOSKIT_BinaryPredicate_r GEOSTouches_r;
  GEOSKIT_BinaryPredicate_r GEOSIntersects_r;
  GEOSKIT_BinaryPredicate_r GEOSCrosses_r;
  GEOSKIT_BinaryPredicate_r GEOSWithin_r;
  GEOSKIT_BinaryPredicate_r GEOSContains_r;
  GEOSKIT_BinaryPredicate_r GEOSOverlaps_r;
  GEOSKIT_BinaryPredicate_r GEOSCovers_r;
  GEOSKIT_BinaryPredicate_r GEOSCoveredBy_r;
  GEOSKIT_RelatePattern_r GEOSRelatePattern_r;
  GEOSKIT_Relate_r GEOSRelate_r;

  GEOSKIT_UnaryOperator_r GEOSEnvelope_r;
  GEOSKIT_BinaryOperator_r GEOSIntersection_r;
  GEOSKIT_BinaryOperator_r GEOSDifference_r;
  GEOSKIT_BinaryOperator_r GEOSSymDifference_r;
  GEOSKIT_BinaryOperator_r GEOSUnion_r;
  GEOSKIT_UnaryOperator_r GEOSUnaryUnion_r;
  GEOSKIT_UnaryOperator_r GEOSConvexHull_r;
  GEOSKIT_ConcaveHull_r GEOSConcaveHull_r;
  GEOSKIT_UnaryOperator_r GEOSMinimumRotatedRectangle_r;
  GEOSKIT_UnaryOperator_r GEOSMinimumWidth_r;
  GEOSKIT_UnaryOperator_r GEOSPointOnSurface_r;
  GEOSKIT_UnaryOperator_r GEOSGetCentroid_r;
  GEOSKIT_MinimumBoundingCircle_r GEOSMinimumBoundingCircle_r;
  GEOSKIT_Polygonize_r GEOSPolygonize_r;
  GEOSKIT_UnaryOperator_r GEOSLineMerge_r;
  GEOSKIT_UnaryOperator_r GEOSLineMergeDirected_r;
  GEOSKIT_ToleranceOperator_r GEOSSimplify_r;
  GEOSKIT_ToleranceOperator_r GEOSTopologyPreserveSimplify_r;
  GEOSKIT_Snap_r GEOSSnap_r;
  GEOSKIT_Normalize_r GEOSNormalize_r;

  GEOSKIT_Buffer_r GEOSBuffer_r;
  GEOSKIT_BufferParams_create_r GEOSBufferParams_create_r;
  GEOSKIT_BufferParams_destroy_r GEOSBufferParams_destroy_r;
  GEOSKIT_BufferParams_setStyle_r GEOSBufferParams_setEndCapStyle_r;
  GEOSKIT_BufferParams_setStyle_r GEOSBufferParams_setJoinStyle_r;
  GEOSKIT_BufferParams_setMitreLimit_r GEOSBufferParams_setMitreLimit_r;
  GEOSKIT_BufferParams_setStyle_r GEOSBufferParams_setQuadrantSegments_r;
  GEOSKIT_BufferWithParams_r GEOSBufferWithParams_r;
  GEOSKIT_OffsetCurve_r GEOSOffsetCurve_r;

  GEOSKIT_UnaryOperator_r GEOSMakeValid_r;
  GEOSKIT_MakeValidParams_create_r GEOSMakeValidParams_create_r;
  GEOSKIT_MakeValidParams_destroy_r GEOSMakeValidParams_destroy_r;
  GEOSKIT_MakeValidParams_setInt_r GEOSMakeValidParams_setMethod_r;
  GEOSKIT_MakeValidParams_setInt_r GEOSMakeValidParams_setKeepCollapsed_r;
  GEOSKIT_MakeValidWithParams_r GEOSMakeValidWithParams_r;

  GEOSKIT_Prepare_r GEOSPrepare_r;
  GEOSKIT_PreparedGeom_destroy_r GEOSPreparedGeom_destroy_r;
  GEOSKIT_PreparedPredicate_r GEOSPreparedContains_r;
  GEOSKIT_PreparedPredicate_r GEOSPreparedContainsProperly_r;
  GEOSKIT_PreparedPredicate_r GEOSPreparedCoveredBy_r;
  GEOSKIT_PreparedPredicate_r GEOSPreparedCovers_r;
  GEOSKIT_PreparedPredicate_r GEOSPreparedCrosses_r;
  GEOSKIT_PreparedPredicate_r GEOSPreparedDisjoint_r;
  GEOSKIT_PreparedPredicate_r GEOSPreparedIntersects_r;
  GEOSKIT_PreparedPredicate_r GEOSPreparedOverlaps_r;
  GEOSKIT_PreparedPredicate_r GEOSPreparedTouches_r;
  GEOSKIT_PreparedPredicate_r GEOSPreparedWithin_r;

  // A value-initialized GeosLibrary (`new GeosLibrary()`) has every handle
  // and entry point set to null.
  ~GeosLibrary();

  // Init resolves every entry point from geoscHandle. Returns the loader's
  // error message, or nullptr on success.
  const char* Init();

 private:
  template <typename T> const char* InitSym(T* ptr, const char* symbol);
};

}  // namespace geoskit
