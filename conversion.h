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

#include "geos_object.h"
#include "include/geoskit/geometry.h"

namespace geoskit {

// ToNative builds the GEOS geometry for g on ctx and stores it in out.
Status ToNative(Context* ctx, const Geometry& g, GeosObject* out);

// FromNative decodes the GEOS geometry g, which stays owned by the caller.
// A LinearRing decodes as a LineString. A shape with fewer coordinates than
// it requires (an empty Point, a LineString with fewer than 2 points, a ring
// with fewer than 4) fails with TooFewPoints.
Status FromNative(Context* ctx, GEOSKIT_Geometry g, Geometry* out);

// The typed forms additionally fail with TypeMismatch if g is not of the
// requested shape.
Status FromNative(Context* ctx, GEOSKIT_Geometry g, Point* out);
Status FromNative(Context* ctx, GEOSKIT_Geometry g, LineString* out);
Status FromNative(Context* ctx, GEOSKIT_Geometry g, Polygon* out);
Status FromNative(Context* ctx, GEOSKIT_Geometry g, GeometryCollection* out);

// ReadCoordSeq decodes every coordinate in seq. hasZ selects whether z is
// read.
Status ReadCoordSeq(Context* ctx, GEOSKIT_CoordSeq seq, bool hasZ, std::vector<Point>* out);

}  // namespace geoskit
