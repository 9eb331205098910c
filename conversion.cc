// Copyright 2020 The Cockroach Authors.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "conversion.h"
#include <fmt/format.h>
#include <string>

namespace geoskit {

namespace {

//
// Encoding.
//

Status NewCoordSeq(Context* ctx, const std::vector<Point>& points, GEOSKIT_CoordSeq* ret) {
  auto lib = ctx->lib();
  bool hasZ = false;
  for (const auto& p : points) {
    hasZ = hasZ || p.HasZ();
  }
  unsigned int dims = hasZ ? 3 : 2;
  ScopedGeosResource seq(ctx, lib->GEOSCoordSeq_create_r(ctx->handle(), points.size(), dims),
                         lib->GEOSCoordSeq_destroy_r);
  if (seq.get() == nullptr) {
    return ctx->LibraryError();
  }
  for (unsigned int i = 0; i < points.size(); i++) {
    const Point& p = points[i];
    int r = hasZ ? lib->GEOSCoordSeq_setXYZ_r(ctx->handle(), seq.get(), i, p.x, p.y, p.z)
                 : lib->GEOSCoordSeq_setXY_r(ctx->handle(), seq.get(), i, p.x, p.y);
    if (r == 0) {
      return ctx->LibraryError();
    }
  }
  *ret = seq.release();
  return Status::OK();
}

// NewFromCoordSeq builds a point, line string or linear ring. GEOS takes
// ownership of the sequence whether or not construction succeeds.
Status NewFromCoordSeq(Context* ctx, GEOSKIT_Geom_createFromCoordSeq_r create,
                       const std::vector<Point>& points, GeosObject* out) {
  GEOSKIT_CoordSeq seq = nullptr;
  auto s = NewCoordSeq(ctx, points, &seq);
  if (!s.ok()) {
    return s;
  }
  GeosObject geom(ctx, create(ctx->handle(), seq));
  if (geom.pointer() == nullptr) {
    return ctx->LibraryError();
  }
  *out = std::move(geom);
  return Status::OK();
}

Status NewPoint(Context* ctx, const Point& p, GeosObject* out) {
  return NewFromCoordSeq(ctx, ctx->lib()->GEOSGeom_createPoint_r, std::vector<Point>{p}, out);
}

Status NewLineString(Context* ctx, const LineString& line, GeosObject* out) {
  return NewFromCoordSeq(ctx, ctx->lib()->GEOSGeom_createLineString_r, line.points, out);
}

Status NewLinearRing(Context* ctx, const LinearRing& ring, GeosObject* out) {
  return NewFromCoordSeq(ctx, ctx->lib()->GEOSGeom_createLinearRing_r, ring.points, out);
}

Status NewPolygon(Context* ctx, const Polygon& polygon, GeosObject* out) {
  GeosObject shell;
  auto s = NewLinearRing(ctx, polygon.exterior, &shell);
  if (!s.ok()) {
    return s;
  }
  std::vector<GeosObject> holes(polygon.holes.size());
  for (size_t i = 0; i < polygon.holes.size(); i++) {
    s = NewLinearRing(ctx, polygon.holes[i], &holes[i]);
    if (!s.ok()) {
      return s;
    }
  }

  // GEOS takes ownership of the rings, even on failure.
  std::vector<GEOSKIT_Geometry> holePtrs;
  for (auto& hole : holes) {
    holePtrs.push_back(hole.release());
  }
  GeosObject geom(ctx, ctx->lib()->GEOSGeom_createPolygon_r(ctx->handle(), shell.release(),
                                                            holePtrs.data(), holePtrs.size()));
  if (geom.pointer() == nullptr) {
    return ctx->LibraryError();
  }
  *out = std::move(geom);
  return Status::OK();
}

// NewCollection takes ownership of members. GEOS takes them over, even on
// failure.
Status NewCollection(Context* ctx, int type, std::vector<GeosObject>* members, GeosObject* out) {
  std::vector<GEOSKIT_Geometry> ptrs;
  for (auto& member : *members) {
    ptrs.push_back(member.release());
  }
  GeosObject geom(ctx, ctx->lib()->GEOSGeom_createCollection_r(ctx->handle(), type, ptrs.data(),
                                                               ptrs.size()));
  if (geom.pointer() == nullptr) {
    return ctx->LibraryError();
  }
  *out = std::move(geom);
  return Status::OK();
}

template <typename T, typename F>
Status NewTypedCollection(Context* ctx, int type, const std::vector<T>& values, F encode,
                          GeosObject* out) {
  std::vector<GeosObject> members(values.size());
  for (size_t i = 0; i < values.size(); i++) {
    auto s = encode(ctx, values[i], &members[i]);
    if (!s.ok()) {
      return s;
    }
  }
  return NewCollection(ctx, type, &members, out);
}

//
// Decoding.
//

Status ReadPoints(Context* ctx, GEOSKIT_Geometry g, std::vector<Point>* points) {
  auto lib = ctx->lib();
  auto seq = lib->GEOSGeom_getCoordSeq_r(ctx->handle(), g);
  if (seq == nullptr) {
    return ctx->LibraryError();
  }
  char hasZ = lib->GEOSHasZ_r(ctx->handle(), g);
  if (hasZ != 0 && hasZ != 1) {
    return ctx->LibraryError();
  }
  return ReadCoordSeq(ctx, seq, hasZ == 1, points);
}

Status TooFewPoints(const char* shape, size_t got, size_t want) {
  return Status::TooFewPoints(
      fmt::format("{} has {} points, needs at least {}", shape, got, want));
}

Status DecodePoint(Context* ctx, GEOSKIT_Geometry g, Point* out) {
  std::vector<Point> points;
  auto s = ReadPoints(ctx, g, &points);
  if (!s.ok()) {
    return s;
  }
  if (points.empty()) {
    return TooFewPoints("Point", 0, 1);
  }
  *out = points[0];
  return Status::OK();
}

Status DecodePoints(Context* ctx, GEOSKIT_Geometry g, const char* shape, size_t min,
                    std::vector<Point>* out) {
  std::vector<Point> points;
  auto s = ReadPoints(ctx, g, &points);
  if (!s.ok()) {
    return s;
  }
  if (points.size() < min) {
    return TooFewPoints(shape, points.size(), min);
  }
  *out = std::move(points);
  return Status::OK();
}

Status DecodeRing(Context* ctx, GEOSKIT_Geometry g, LinearRing* out) {
  if (g == nullptr) {
    return ctx->LibraryError();
  }
  return DecodePoints(ctx, g, "LinearRing", 4, &out->points);
}

Status DecodePolygon(Context* ctx, GEOSKIT_Geometry g, Polygon* out) {
  auto lib = ctx->lib();
  Polygon polygon;
  auto s = DecodeRing(ctx, lib->GEOSGetExteriorRing_r(ctx->handle(), g), &polygon.exterior);
  if (!s.ok()) {
    return s;
  }
  int numHoles = lib->GEOSGetNumInteriorRings_r(ctx->handle(), g);
  if (numHoles < 0) {
    return ctx->LibraryError();
  }
  polygon.holes.resize(numHoles);
  for (int i = 0; i < numHoles; i++) {
    s = DecodeRing(ctx, lib->GEOSGetInteriorRingN_r(ctx->handle(), g, i), &polygon.holes[i]);
    if (!s.ok()) {
      return s;
    }
  }
  *out = std::move(polygon);
  return Status::OK();
}

// DecodeMembers decodes every member of the collection g into T with the
// typed FromNative, so a member of the wrong shape is a TypeMismatch.
template <typename T> Status DecodeMembers(Context* ctx, GEOSKIT_Geometry g, std::vector<T>* out) {
  auto lib = ctx->lib();
  int n = lib->GEOSGetNumGeometries_r(ctx->handle(), g);
  if (n < 0) {
    return ctx->LibraryError();
  }
  std::vector<T> members(n);
  for (int i = 0; i < n; i++) {
    auto member = lib->GEOSGetGeometryN_r(ctx->handle(), g, i);
    if (member == nullptr) {
      return ctx->LibraryError();
    }
    auto s = FromNative(ctx, member, &members[i]);
    if (!s.ok()) {
      return s;
    }
  }
  *out = std::move(members);
  return Status::OK();
}

Status TypeId(Context* ctx, GEOSKIT_Geometry g, int* ret) {
  int type = ctx->lib()->GEOSGeomTypeId_r(ctx->handle(), g);
  if (type < 0) {
    return ctx->LibraryError();
  }
  *ret = type;
  return Status::OK();
}

Status ExpectType(Context* ctx, GEOSKIT_Geometry g, const char* want, int type, int alt = -1) {
  int got = 0;
  auto s = TypeId(ctx, g, &got);
  if (!s.ok()) {
    return s;
  }
  if (got != type && got != alt) {
    return Status::TypeMismatch(fmt::format("geos: expected {}, got type id {}", want, got));
  }
  return Status::OK();
}

}  // namespace

Status ReadCoordSeq(Context* ctx, GEOSKIT_CoordSeq seq, bool hasZ, std::vector<Point>* out) {
  auto lib = ctx->lib();
  unsigned int size = 0;
  if (lib->GEOSCoordSeq_getSize_r(ctx->handle(), seq, &size) == 0) {
    return ctx->LibraryError();
  }
  std::vector<Point> points(size);
  for (unsigned int i = 0; i < size; i++) {
    Point& p = points[i];
    int r = hasZ ? lib->GEOSCoordSeq_getXYZ_r(ctx->handle(), seq, i, &p.x, &p.y, &p.z)
                 : lib->GEOSCoordSeq_getXY_r(ctx->handle(), seq, i, &p.x, &p.y);
    if (r == 0) {
      return ctx->LibraryError();
    }
  }
  *out = std::move(points);
  return Status::OK();
}

Status ToNative(Context* ctx, const Geometry& g, GeosObject* out) {
  switch (g.type()) {
    case GeometryType::kPoint:
      return NewPoint(ctx, *g.point(), out);
    case GeometryType::kLineString:
      return NewLineString(ctx, *g.line_string(), out);
    case GeometryType::kPolygon:
      return NewPolygon(ctx, *g.polygon(), out);
    case GeometryType::kMultiPoint:
      return NewTypedCollection(ctx, GEOSKIT_MULTIPOINT, g.multi_point()->points, NewPoint, out);
    case GeometryType::kMultiLineString:
      return NewTypedCollection(ctx, GEOSKIT_MULTILINESTRING, g.multi_line_string()->line_strings,
                                NewLineString, out);
    case GeometryType::kMultiPolygon:
      return NewTypedCollection(ctx, GEOSKIT_MULTIPOLYGON, g.multi_polygon()->polygons, NewPolygon,
                                out);
    case GeometryType::kGeometryCollection:
      return NewTypedCollection(ctx, GEOSKIT_GEOMETRYCOLLECTION, g.collection()->geometries,
                                ToNative, out);
  }
  return Status::UnsupportedType(fmt::format("cannot encode {}", GeometryTypeName(g.type())));
}

Status FromNative(Context* ctx, GEOSKIT_Geometry g, Geometry* out) {
  int type = 0;
  auto s = TypeId(ctx, g, &type);
  if (!s.ok()) {
    return s;
  }
  switch (type) {
    case GEOSKIT_POINT: {
      Point p;
      s = DecodePoint(ctx, g, &p);
      if (s.ok()) {
        *out = p;
      }
      return s;
    }
    case GEOSKIT_LINESTRING:
    case GEOSKIT_LINEARRING: {
      LineString line;
      s = DecodePoints(ctx, g, "LineString", 2, &line.points);
      if (s.ok()) {
        *out = line;
      }
      return s;
    }
    case GEOSKIT_POLYGON: {
      Polygon polygon;
      s = DecodePolygon(ctx, g, &polygon);
      if (s.ok()) {
        *out = polygon;
      }
      return s;
    }
    case GEOSKIT_MULTIPOINT: {
      MultiPoint multi;
      s = DecodeMembers(ctx, g, &multi.points);
      if (s.ok()) {
        *out = multi;
      }
      return s;
    }
    case GEOSKIT_MULTILINESTRING: {
      MultiLineString multi;
      s = DecodeMembers(ctx, g, &multi.line_strings);
      if (s.ok()) {
        *out = multi;
      }
      return s;
    }
    case GEOSKIT_MULTIPOLYGON: {
      MultiPolygon multi;
      s = DecodeMembers(ctx, g, &multi.polygons);
      if (s.ok()) {
        *out = multi;
      }
      return s;
    }
    case GEOSKIT_GEOMETRYCOLLECTION: {
      GeometryCollection collection;
      s = DecodeMembers(ctx, g, &collection.geometries);
      if (s.ok()) {
        *out = collection;
      }
      return s;
    }
    default:
      return Status::UnsupportedType(fmt::format("geos: unsupported geometry type id {}", type));
  }
}

Status FromNative(Context* ctx, GEOSKIT_Geometry g, Point* out) {
  auto s = ExpectType(ctx, g, "Point", GEOSKIT_POINT);
  if (!s.ok()) {
    return s;
  }
  return DecodePoint(ctx, g, out);
}

Status FromNative(Context* ctx, GEOSKIT_Geometry g, LineString* out) {
  auto s = ExpectType(ctx, g, "LineString", GEOSKIT_LINESTRING, GEOSKIT_LINEARRING);
  if (!s.ok()) {
    return s;
  }
  return DecodePoints(ctx, g, "LineString", 2, &out->points);
}

Status FromNative(Context* ctx, GEOSKIT_Geometry g, Polygon* out) {
  auto s = ExpectType(ctx, g, "Polygon", GEOSKIT_POLYGON);
  if (!s.ok()) {
    return s;
  }
  return DecodePolygon(ctx, g, out);
}

Status FromNative(Context* ctx, GEOSKIT_Geometry g, GeometryCollection* out) {
  auto s = ExpectType(ctx, g, "GeometryCollection", GEOSKIT_GEOMETRYCOLLECTION);
  if (!s.ok()) {
    return s;
  }
  return DecodeMembers(ctx, g, &out->geometries);
}

}  // namespace geoskit
