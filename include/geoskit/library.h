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

#include <string>
#include "status.h"

namespace geoskit {

// GeosLibrary contains all the GEOS entry points geoskit calls, resolved at
// runtime with dlopen/dlsym. It is opaque to callers.
struct GeosLibrary;

// LibraryOptions locates the GEOS shared libraries.
struct LibraryOptions {
  // Path or soname of the GEOS C API library (libgeos_c).
  std::string geosc_location;
  // Path or soname of the GEOS C++ library (libgeos) that libgeos_c links
  // against.
  std::string geos_location;
};

// DefaultLibraryOptions returns the platform sonames, overridden by the
// GEOSKIT_GEOSC_LIBRARY and GEOSKIT_GEOS_LIBRARY environment variables when
// they are set.
LibraryOptions DefaultLibraryOptions();

// OpenGeosLibrary loads GEOS using dlopen/dlsym and stores the resolved
// entry points in lib. libgeos is opened before libgeos_c so that libgeos_c
// resolves against it. On failure no handle is left open and lib is not
// modified.
Status OpenGeosLibrary(const LibraryOptions& options, GeosLibrary** lib);

// CloseGeosLibrary releases a library returned by OpenGeosLibrary. No
// geoskit call may be in flight on lib.
void CloseGeosLibrary(GeosLibrary* lib);

// DefaultGeosLibrary loads GEOS with DefaultLibraryOptions the first time it
// is called and returns the same library, or the same load error, on every
// call thereafter. The returned library is never closed.
Status DefaultGeosLibrary(GeosLibrary** lib);

}  // namespace geoskit
