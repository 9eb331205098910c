// Copyright 2020 The Cockroach Authors.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include <fmt/format.h>
#include <algorithm>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "context.h"
#include "conversion.h"
#include "geos_object.h"
#include "include/geoskit/geoskit.h"

namespace geoskit {

namespace {

// NewSession creates a Context on lib and converts each input geometry to
// GEOS under it.
Status NewSession(GeosLibrary* lib, std::unique_ptr<Context>* ctx,
                  std::initializer_list<std::pair<const Geometry*, GeosObject*>> inputs) {
  auto s = Context::Create(lib, ctx);
  if (!s.ok()) {
    return s;
  }
  for (const auto& input : inputs) {
    s = ToNative(ctx->get(), *input.first, input.second);
    if (!s.ok()) {
      return s;
    }
  }
  return Status::OK();
}

// PredicateResult maps the GEOS tri-state predicate result: 1 is true, 0 is
// false and anything else (GEOS uses 2) is an error.
Status PredicateResult(const Context& ctx, char r, bool* ret) {
  switch (r) {
    case 0:
      *ret = false;
      return Status::OK();
    case 1:
      *ret = true;
      return Status::OK();
  }
  return ctx.LibraryError();
}

// OptionalResult absorbs a TooFewPoints decode into an absent result.
Status OptionalResult(const Status& s, const Geometry& value, std::unique_ptr<Geometry>* ret) {
  ret->reset();
  if (s.IsTooFewPoints()) {
    return Status::OK();
  }
  if (!s.ok()) {
    return s;
  }
  ret->reset(new Geometry(value));
  return Status::OK();
}

//
// Unary operators.
//

// A result of 0 indicates an exception.
template <typename T> Status UnaryScalar(GeosLibrary* lib, T fn, const Geometry& g, double* ret) {
  std::unique_ptr<Context> ctx;
  GeosObject geom;
  auto s = NewSession(lib, &ctx, {{&g, &geom}});
  if (!s.ok()) {
    return s;
  }
  double value = 0;
  if (fn(ctx->handle(), geom.pointer(), &value) == 0) {
    return ctx->LibraryError();
  }
  *ret = value;
  return Status::OK();
}

template <typename T> Status UnaryPredicate(GeosLibrary* lib, T fn, const Geometry& g, bool* ret) {
  std::unique_ptr<Context> ctx;
  GeosObject geom;
  auto s = NewSession(lib, &ctx, {{&g, &geom}});
  if (!s.ok()) {
    return s;
  }
  return PredicateResult(*ctx, fn(ctx->handle(), geom.pointer()), ret);
}

// UnaryOperator runs fn, which returns a new geometry or null on failure,
// and decodes its result into R.
template <typename T, typename R>
Status UnaryOperator(GeosLibrary* lib, T fn, const Geometry& g, R* ret) {
  std::unique_ptr<Context> ctx;
  GeosObject geom;
  auto s = NewSession(lib, &ctx, {{&g, &geom}});
  if (!s.ok()) {
    return s;
  }
  GeosObject result(ctx.get(), fn(ctx->handle(), geom.pointer()));
  if (result.pointer() == nullptr) {
    return ctx->LibraryError();
  }
  return FromNative(ctx.get(), result.pointer(), ret);
}

template <typename T>
Status UnaryOptional(GeosLibrary* lib, T fn, const Geometry& g, std::unique_ptr<Geometry>* ret) {
  Geometry value;
  auto s = UnaryOperator(lib, fn, g, &value);
  return OptionalResult(s, value, ret);
}

//
// Binary operators.
//

template <typename T>
Status BinaryScalar(GeosLibrary* lib, T fn, const Geometry& a, const Geometry& b, double* ret) {
  std::unique_ptr<Context> ctx;
  GeosObject geomA;
  GeosObject geomB;
  auto s = NewSession(lib, &ctx, {{&a, &geomA}, {&b, &geomB}});
  if (!s.ok()) {
    return s;
  }
  double value = 0;
  if (fn(ctx->handle(), geomA.pointer(), geomB.pointer(), &value) == 0) {
    return ctx->LibraryError();
  }
  *ret = value;
  return Status::OK();
}

template <typename T>
Status BinaryPredicate(GeosLibrary* lib, T fn, const Geometry& a, const Geometry& b, bool* ret) {
  std::unique_ptr<Context> ctx;
  GeosObject geomA;
  GeosObject geomB;
  auto s = NewSession(lib, &ctx, {{&a, &geomA}, {&b, &geomB}});
  if (!s.ok()) {
    return s;
  }
  return PredicateResult(*ctx, fn(ctx->handle(), geomA.pointer(), geomB.pointer()), ret);
}

template <typename T, typename R>
Status BinaryOperator(GeosLibrary* lib, T fn, const Geometry& a, const Geometry& b, R* ret) {
  std::unique_ptr<Context> ctx;
  GeosObject geomA;
  GeosObject geomB;
  auto s = NewSession(lib, &ctx, {{&a, &geomA}, {&b, &geomB}});
  if (!s.ok()) {
    return s;
  }
  GeosObject result(ctx.get(), fn(ctx->handle(), geomA.pointer(), geomB.pointer()));
  if (result.pointer() == nullptr) {
    return ctx->LibraryError();
  }
  return FromNative(ctx.get(), result.pointer(), ret);
}

template <typename T>
Status BinaryOptional(GeosLibrary* lib, T fn, const Geometry& a, const Geometry& b,
                      std::unique_ptr<Geometry>* ret) {
  Geometry value;
  auto s = BinaryOperator(lib, fn, a, b, &value);
  return OptionalResult(s, value, ret);
}

bool ValidRelateMask(const std::string& mask) {
  if (mask.size() != 9) {
    return false;
  }
  for (char c : mask) {
    switch (c) {
      case '0':
      case '1':
      case '2':
      case 'T':
      case 'F':
      case '*':
        break;
      default:
        return false;
    }
  }
  return true;
}

}  // namespace

//
// Measurement.
//

Status Length(GeosLibrary* lib, const Geometry& g, double* ret) {
  return UnaryScalar(lib, lib->GEOSLength_r, g, ret);
}

Status Area(GeosLibrary* lib, const Geometry& g, double* ret) {
  return UnaryScalar(lib, lib->GEOSArea_r, g, ret);
}

Status Distance(GeosLibrary* lib, const Geometry& a, const Geometry& b, double* ret) {
  return BinaryScalar(lib, lib->GEOSDistance_r, a, b, ret);
}

Status HausdorffDistance(GeosLibrary* lib, const Geometry& a, const Geometry& b, double* ret) {
  return BinaryScalar(lib, lib->GEOSHausdorffDistance_r, a, b, ret);
}

Status HausdorffDistanceDensify(GeosLibrary* lib, const Geometry& a, const Geometry& b,
                                double densify_fraction, double* ret) {
  auto fn = lib->GEOSHausdorffDistanceDensify_r;
  return BinaryScalar(lib,
                      [fn, densify_fraction](GEOSKIT_Handle h, GEOSKIT_Geometry a,
                                             GEOSKIT_Geometry b, double* value) {
                        return fn(h, a, b, densify_fraction, value);
                      },
                      a, b, ret);
}

Status NearestPoints(GeosLibrary* lib, const Geometry& a, const Geometry& b,
                     std::vector<Point>* ret) {
  std::unique_ptr<Context> ctx;
  GeosObject geomA;
  GeosObject geomB;
  auto s = NewSession(lib, &ctx, {{&a, &geomA}, {&b, &geomB}});
  if (!s.ok()) {
    return s;
  }
  ScopedGeosResource seq(ctx.get(),
                         lib->GEOSNearestPoints_r(ctx->handle(), geomA.pointer(), geomB.pointer()),
                         lib->GEOSCoordSeq_destroy_r);
  if (seq.get() == nullptr) {
    return ctx->LibraryError();
  }
  return ReadCoordSeq(ctx.get(), seq.get(), false /* hasZ */, ret);
}

//
// Validity checking.
//

Status IsEmpty(GeosLibrary* lib, const Geometry& g, bool* ret) {
  return UnaryPredicate(lib, lib->GEOSisEmpty_r, g, ret);
}

Status IsRing(GeosLibrary* lib, const Geometry& g, bool* ret) {
  return UnaryPredicate(lib, lib->GEOSisRing_r, g, ret);
}

Status IsValid(GeosLibrary* lib, const Geometry& g, bool* ret) {
  return UnaryPredicate(lib, lib->GEOSisValid_r, g, ret);
}

Status IsValidReason(GeosLibrary* lib, const Geometry& g, std::string* ret) {
  std::unique_ptr<Context> ctx;
  GeosObject geom;
  auto s = NewSession(lib, &ctx, {{&g, &geom}});
  if (!s.ok()) {
    return s;
  }
  ScopedGeosResource reason(ctx.get(), lib->GEOSisValidReason_r(ctx->handle(), geom.pointer()),
                            lib->GEOSFree_r);
  if (reason.get() == nullptr) {
    return ctx->LibraryError();
  }
  *ret = static_cast<const char*>(reason.get());
  return Status::OK();
}

Status IsValidDetail(GeosLibrary* lib, const Geometry& g,
                     bool allow_self_touching_ring_forming_hole, ValidityDetail* ret) {
  std::unique_ptr<Context> ctx;
  GeosObject geom;
  auto s = NewSession(lib, &ctx, {{&g, &geom}});
  if (!s.ok()) {
    return s;
  }
  int flags = 0;
  if (allow_self_touching_ring_forming_hole) {
    flags = GEOSKIT_VALID_ALLOW_SELFTOUCHING_RING_FORMING_HOLE;
  }
  char* reasonPtr = nullptr;
  GEOSKIT_Geometry locationPtr = nullptr;
  char r =
      lib->GEOSisValidDetail_r(ctx->handle(), geom.pointer(), flags, &reasonPtr, &locationPtr);
  // Both outputs are owned here on every path, including the ones where
  // they carry no information.
  ScopedGeosResource reason(ctx.get(), reasonPtr, lib->GEOSFree_r);
  GeosObject location(ctx.get(), locationPtr);

  switch (r) {
    case 1:
      *ret = ValidityDetail();
      return Status::OK();
    case 0: {
      ValidityDetail detail;
      detail.valid = false;
      if (reason.get() != nullptr) {
        detail.has_reason = true;
        detail.reason = static_cast<const char*>(reason.get());
      }
      if (location.pointer() != nullptr) {
        s = FromNative(ctx.get(), location.pointer(), &detail.location);
        if (!s.ok()) {
          return s;
        }
        detail.has_location = true;
      }
      *ret = detail;
      return Status::OK();
    }
  }
  return ctx->LibraryError();
}

//
// Binary predicates.
//

Status IsTopologicallyEquivalent(GeosLibrary* lib, const Geometry& a, const Geometry& b,
                                 bool* ret) {
  return BinaryPredicate(lib, lib->GEOSEquals_r, a, b, ret);
}

Status IsDisjoint(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret) {
  return BinaryPredicate(lib, lib->GEOSDisjoint_r, a, b, ret);
}

Status Touches(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret) {
  return BinaryPredicate(lib, lib->GEOSTouches_r, a, b, ret);
}

Status Intersects(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret) {
  return BinaryPredicate(lib, lib->GEOSIntersects_r, a, b, ret);
}

Status Crosses(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret) {
  return BinaryPredicate(lib, lib->GEOSCrosses_r, a, b, ret);
}

Status IsWithin(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret) {
  return BinaryPredicate(lib, lib->GEOSWithin_r, a, b, ret);
}

Status Contains(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret) {
  return BinaryPredicate(lib, lib->GEOSContains_r, a, b, ret);
}

Status Overlaps(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret) {
  return BinaryPredicate(lib, lib->GEOSOverlaps_r, a, b, ret);
}

Status Covers(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret) {
  return BinaryPredicate(lib, lib->GEOSCovers_r, a, b, ret);
}

Status IsCovered(GeosLibrary* lib, const Geometry& a, const Geometry& b, bool* ret) {
  return BinaryPredicate(lib, lib->GEOSCoveredBy_r, a, b, ret);
}

Status Relate(GeosLibrary* lib, const Geometry& a, const Geometry& b, const std::string& mask,
              bool* ret) {
  if (!ValidRelateMask(mask)) {
    return Status::InvalidArgument(fmt::format("invalid DE-9IM mask \"{}\"", mask));
  }
  auto fn = lib->GEOSRelatePattern_r;
  return BinaryPredicate(lib,
                         [fn, &mask](GEOSKIT_Handle h, GEOSKIT_Geometry a, GEOSKIT_Geometry b) {
                           return fn(h, a, b, mask.c_str());
                         },
                         a, b, ret);
}

Status Relate(GeosLibrary* lib, const Geometry& a, const Geometry& b, std::string* ret) {
  std::unique_ptr<Context> ctx;
  GeosObject geomA;
  GeosObject geomB;
  auto s = NewSession(lib, &ctx, {{&a, &geomA}, {&b, &geomB}});
  if (!s.ok()) {
    return s;
  }
  ScopedGeosResource matrix(ctx.get(),
                            lib->GEOSRelate_r(ctx->handle(), geomA.pointer(), geomB.pointer()),
                            lib->GEOSFree_r);
  if (matrix.get() == nullptr) {
    return ctx->LibraryError();
  }
  *ret = static_cast<const char*>(matrix.get());
  return Status::OK();
}

//
// Topology operations.
//

Status GetEnvelope(GeosLibrary* lib, const Geometry& g, Envelope* ret) {
  Geometry result;
  auto s = UnaryOperator(lib, lib->GEOSEnvelope_r, g, &result);
  if (!s.ok()) {
    return s;
  }
  switch (result.type()) {
    case GeometryType::kPoint: {
      const Point& p = *result.point();
      *ret = Envelope(p.x, p.x, p.y, p.y);
      return Status::OK();
    }
    case GeometryType::kPolygon: {
      const auto& points = result.polygon()->exterior.points;
      Envelope env(points[0].x, points[0].x, points[0].y, points[0].y);
      for (const auto& p : points) {
        env.min_x = std::min(env.min_x, p.x);
        env.max_x = std::max(env.max_x, p.x);
        env.min_y = std::min(env.min_y, p.y);
        env.max_y = std::max(env.max_y, p.y);
      }
      *ret = env;
      return Status::OK();
    }
    case GeometryType::kLineString:
    case GeometryType::kMultiPoint:
    case GeometryType::kMultiLineString:
    case GeometryType::kMultiPolygon:
    case GeometryType::kGeometryCollection:
      break;
  }
  return Status::UnexpectedResult(
      fmt::format("geos: envelope returned a {}", GeometryTypeName(result.type())));
}

Status Intersection(GeosLibrary* lib, const Geometry& a, const Geometry& b,
                    std::unique_ptr<Geometry>* ret) {
  return BinaryOptional(lib, lib->GEOSIntersection_r, a, b, ret);
}

Status Difference(GeosLibrary* lib, const Geometry& a, const Geometry& b,
                  std::unique_ptr<Geometry>* ret) {
  return BinaryOptional(lib, lib->GEOSDifference_r, a, b, ret);
}

Status SymmetricDifference(GeosLibrary* lib, const Geometry& a, const Geometry& b,
                           std::unique_ptr<Geometry>* ret) {
  return BinaryOptional(lib, lib->GEOSSymDifference_r, a, b, ret);
}

Status Union(GeosLibrary* lib, const Geometry& a, const Geometry& b, Geometry* ret) {
  return BinaryOperator(lib, lib->GEOSUnion_r, a, b, ret);
}

Status UnaryUnion(GeosLibrary* lib, const Geometry& g, Geometry* ret) {
  return UnaryOperator(lib, lib->GEOSUnaryUnion_r, g, ret);
}

Status ConvexHull(GeosLibrary* lib, const Geometry& g, Geometry* ret) {
  return UnaryOperator(lib, lib->GEOSConvexHull_r, g, ret);
}

Status ConcaveHull(GeosLibrary* lib, const Geometry& g, double ratio, bool allow_holes,
                   Geometry* ret) {
  auto fn = lib->GEOSConcaveHull_r;
  return UnaryOperator(lib,
                       [fn, ratio, allow_holes](GEOSKIT_Handle h, GEOSKIT_Geometry g) {
                         return fn(h, g, ratio, allow_holes ? 1 : 0);
                       },
                       g, ret);
}

Status MinimumRotatedRectangle(GeosLibrary* lib, const Geometry& g, Geometry* ret) {
  return UnaryOperator(lib, lib->GEOSMinimumRotatedRectangle_r, g, ret);
}

Status MinimumWidth(GeosLibrary* lib, const Geometry& g, LineString* ret) {
  return UnaryOperator(lib, lib->GEOSMinimumWidth_r, g, ret);
}

Status PointOnSurface(GeosLibrary* lib, const Geometry& g, Point* ret) {
  return UnaryOperator(lib, lib->GEOSPointOnSurface_r, g, ret);
}

Status Centroid(GeosLibrary* lib, const Geometry& g, Point* ret) {
  return UnaryOperator(lib, lib->GEOSGetCentroid_r, g, ret);
}

Status MinimumBoundingCircle(GeosLibrary* lib, const Geometry& g, Circle* ret) {
  std::unique_ptr<Context> ctx;
  GeosObject geom;
  auto s = NewSession(lib, &ctx, {{&g, &geom}});
  if (!s.ok()) {
    return s;
  }
  double radius = 0;
  GEOSKIT_Geometry centerPtr = nullptr;
  // Only the center and radius are returned; the circle polygon itself is
  // destroyed on the way out.
  GeosObject circle(ctx.get(), lib->GEOSMinimumBoundingCircle_r(ctx->handle(), geom.pointer(),
                                                                &radius, &centerPtr));
  GeosObject center(ctx.get(), centerPtr);
  if (circle.pointer() == nullptr) {
    return ctx->LibraryError();
  }
  if (center.pointer() == nullptr) {
    return Status::NoMinimumBoundingCircle();
  }
  Point p;
  s = FromNative(ctx.get(), center.pointer(), &p);
  if (!s.ok()) {
    return s;
  }
  *ret = Circle(p, radius);
  return Status::OK();
}

Status Polygonize(GeosLibrary* lib, const std::vector<Geometry>& geometries,
                  GeometryCollection* ret) {
  std::unique_ptr<Context> ctx;
  auto s = Context::Create(lib, &ctx);
  if (!s.ok()) {
    return s;
  }
  // Every input stays alive until GEOS has built the result.
  std::vector<GeosObject> inputs(geometries.size());
  std::vector<GEOSKIT_Geometry> ptrs(geometries.size());
  for (size_t i = 0; i < geometries.size(); i++) {
    s = ToNative(ctx.get(), geometries[i], &inputs[i]);
    if (!s.ok()) {
      return s;
    }
    ptrs[i] = inputs[i].pointer();
  }
  GeosObject result(ctx.get(), lib->GEOSPolygonize_r(ctx->handle(), ptrs.data(), ptrs.size()));
  if (result.pointer() == nullptr) {
    return ctx->LibraryError();
  }
  return FromNative(ctx.get(), result.pointer(), ret);
}

Status Polygonize(GeosLibrary* lib, const Geometry& g, GeometryCollection* ret) {
  return Polygonize(lib, std::vector<Geometry>{g}, ret);
}

Status LineMerge(GeosLibrary* lib, const Geometry& g, Geometry* ret) {
  return UnaryOperator(lib, lib->GEOSLineMerge_r, g, ret);
}

Status LineMergeDirected(GeosLibrary* lib, const Geometry& g, Geometry* ret) {
  return UnaryOperator(lib, lib->GEOSLineMergeDirected_r, g, ret);
}

Status Buffer(GeosLibrary* lib, const Geometry& g, double width, std::unique_ptr<Geometry>* ret) {
  return Buffer(lib, g, width, kDefaultQuadrantSegments, ret);
}

Status Buffer(GeosLibrary* lib, const Geometry& g, double width, int quadrant_segments,
              std::unique_ptr<Geometry>* ret) {
  auto fn = lib->GEOSBuffer_r;
  return UnaryOptional(lib,
                       [fn, width, quadrant_segments](GEOSKIT_Handle h, GEOSKIT_Geometry g) {
                         return fn(h, g, width, quadrant_segments);
                       },
                       g, ret);
}

Status BufferWithStyle(GeosLibrary* lib, const Geometry& g, double width,
                       const BufferStyle& style, std::unique_ptr<Geometry>* ret) {
  auto bufferWithParams = [lib, &style, width](GEOSKIT_Handle h,
                                               GEOSKIT_Geometry g) -> GEOSKIT_Geometry {
    auto params = lib->GEOSBufferParams_create_r(h);
    if (params == nullptr) {
      return nullptr;
    }
    GEOSKIT_Geometry result = nullptr;
    if (lib->GEOSBufferParams_setEndCapStyle_r(h, params, static_cast<int>(style.end_cap)) &&
        lib->GEOSBufferParams_setJoinStyle_r(h, params, static_cast<int>(style.join)) &&
        lib->GEOSBufferParams_setMitreLimit_r(h, params, style.mitre_limit) &&
        lib->GEOSBufferParams_setQuadrantSegments_r(h, params, style.quadrant_segments)) {
      result = lib->GEOSBufferWithParams_r(h, g, params, width);
    }
    lib->GEOSBufferParams_destroy_r(h, params);
    return result;
  };
  return UnaryOptional(lib, bufferWithParams, g, ret);
}

Status OffsetCurve(GeosLibrary* lib, const Geometry& g, double width,
                   const OffsetCurveStyle& style, std::unique_ptr<Geometry>* ret) {
  auto fn = lib->GEOSOffsetCurve_r;
  return UnaryOptional(lib,
                       [fn, width, &style](GEOSKIT_Handle h, GEOSKIT_Geometry g) {
                         return fn(h, g, width, style.quadrant_segments,
                                   static_cast<int>(style.join), style.mitre_limit);
                       },
                       g, ret);
}

Status Simplify(GeosLibrary* lib, const Geometry& g, double tolerance, Geometry* ret) {
  auto fn = lib->GEOSSimplify_r;
  return UnaryOperator(lib,
                       [fn, tolerance](GEOSKIT_Handle h, GEOSKIT_Geometry g) {
                         return fn(h, g, tolerance);
                       },
                       g, ret);
}

Status TopologyPreserveSimplify(GeosLibrary* lib, const Geometry& g, double tolerance,
                                Geometry* ret) {
  auto fn = lib->GEOSTopologyPreserveSimplify_r;
  return UnaryOperator(lib,
                       [fn, tolerance](GEOSKIT_Handle h, GEOSKIT_Geometry g) {
                         return fn(h, g, tolerance);
                       },
                       g, ret);
}

Status Snap(GeosLibrary* lib, const Geometry& g, const Geometry& to, double tolerance,
            Geometry* ret) {
  auto fn = lib->GEOSSnap_r;
  return BinaryOperator(lib,
                        [fn, tolerance](GEOSKIT_Handle h, GEOSKIT_Geometry a, GEOSKIT_Geometry b) {
                          return fn(h, a, b, tolerance);
                        },
                        g, to, ret);
}

Status Normalized(GeosLibrary* lib, const Geometry& g, Geometry* ret) {
  std::unique_ptr<Context> ctx;
  GeosObject geom;
  auto s = NewSession(lib, &ctx, {{&g, &geom}});
  if (!s.ok()) {
    return s;
  }
  // Normalize works in place and returns -1 on exception.
  if (lib->GEOSNormalize_r(ctx->handle(), geom.pointer()) == -1) {
    return ctx->LibraryError();
  }
  return FromNative(ctx.get(), geom.pointer(), ret);
}

Status MakeValid(GeosLibrary* lib, const Geometry& g, Geometry* ret) {
  return UnaryOperator(lib, lib->GEOSMakeValid_r, g, ret);
}

Status MakeValid(GeosLibrary* lib, const Geometry& g, const MakeValidMethod& method,
                 Geometry* ret) {
  auto makeValidWithParams = [lib, &method](GEOSKIT_Handle h,
                                            GEOSKIT_Geometry g) -> GEOSKIT_Geometry {
    auto params = lib->GEOSMakeValidParams_create_r(h);
    if (params == nullptr) {
      return nullptr;
    }
    GEOSKIT_Geometry result = nullptr;
    bool ok = false;
    switch (method.algorithm) {
      case MakeValidMethod::kLinework:
        ok = lib->GEOSMakeValidParams_setMethod_r(h, params, GEOSKIT_MAKE_VALID_LINEWORK) != 0;
        break;
      case MakeValidMethod::kStructure:
        ok = lib->GEOSMakeValidParams_setMethod_r(h, params, GEOSKIT_MAKE_VALID_STRUCTURE) != 0 &&
             lib->GEOSMakeValidParams_setKeepCollapsed_r(h, params, method.keep_collapsed) != 0;
        break;
    }
    if (ok) {
      result = lib->GEOSMakeValidWithParams_r(h, g, params);
    }
    lib->GEOSMakeValidParams_destroy_r(h, params);
    return result;
  };
  return UnaryOperator(lib, makeValidWithParams, g, ret);
}

}  // namespace geoskit
