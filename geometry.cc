// Copyright 2020 The Cockroach Authors.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "include/geoskit/geometry.h"
#include <ostream>

namespace geoskit {

const char* GeometryTypeName(GeometryType type) {
  switch (type) {
    case GeometryType::kPoint:
      return "Point";
    case GeometryType::kLineString:
      return "LineString";
    case GeometryType::kPolygon:
      return "Polygon";
    case GeometryType::kMultiPoint:
      return "MultiPoint";
    case GeometryType::kMultiLineString:
      return "MultiLineString";
    case GeometryType::kMultiPolygon:
      return "MultiPolygon";
    case GeometryType::kGeometryCollection:
      return "GeometryCollection";
  }
  return "Unknown";
}

Geometry::Geometry()
    : type_(GeometryType::kGeometryCollection),
      value_(std::make_shared<GeometryCollection>()) {}

Geometry::Geometry(const Point& point)
    : type_(GeometryType::kPoint), value_(std::make_shared<Point>(point)) {}

Geometry::Geometry(const LineString& line_string)
    : type_(GeometryType::kLineString), value_(std::make_shared<LineString>(line_string)) {}

Geometry::Geometry(const Polygon& polygon)
    : type_(GeometryType::kPolygon), value_(std::make_shared<Polygon>(polygon)) {}

Geometry::Geometry(const MultiPoint& multi_point)
    : type_(GeometryType::kMultiPoint), value_(std::make_shared<MultiPoint>(multi_point)) {}

Geometry::Geometry(const MultiLineString& multi_line_string)
    : type_(GeometryType::kMultiLineString),
      value_(std::make_shared<MultiLineString>(multi_line_string)) {}

Geometry::Geometry(const MultiPolygon& multi_polygon)
    : type_(GeometryType::kMultiPolygon),
      value_(std::make_shared<MultiPolygon>(multi_polygon)) {}

Geometry::Geometry(const GeometryCollection& collection)
    : type_(GeometryType::kGeometryCollection),
      value_(std::make_shared<GeometryCollection>(collection)) {}

const Point* Geometry::point() const { return get<Point>(GeometryType::kPoint); }

const LineString* Geometry::line_string() const {
  return get<LineString>(GeometryType::kLineString);
}

const Polygon* Geometry::polygon() const { return get<Polygon>(GeometryType::kPolygon); }

const MultiPoint* Geometry::multi_point() const {
  return get<MultiPoint>(GeometryType::kMultiPoint);
}

const MultiLineString* Geometry::multi_line_string() const {
  return get<MultiLineString>(GeometryType::kMultiLineString);
}

const MultiPolygon* Geometry::multi_polygon() const {
  return get<MultiPolygon>(GeometryType::kMultiPolygon);
}

const GeometryCollection* Geometry::collection() const {
  return get<GeometryCollection>(GeometryType::kGeometryCollection);
}

Geometry Envelope::ToGeometry() const {
  if (min_x == max_x && min_y == max_y) {
    return Point(min_x, min_y);
  }
  return Polygon(LinearRing({
      Point(min_x, min_y),
      Point(max_x, min_y),
      Point(max_x, max_y),
      Point(min_x, max_y),
      Point(min_x, min_y),
  }));
}

bool operator==(const Point& a, const Point& b) {
  if (a.x != b.x || a.y != b.y) {
    return false;
  }
  if (a.HasZ() != b.HasZ()) {
    return false;
  }
  return !a.HasZ() || a.z == b.z;
}

bool operator==(const LineString& a, const LineString& b) { return a.points == b.points; }

bool operator==(const LinearRing& a, const LinearRing& b) { return a.points == b.points; }

bool operator==(const Polygon& a, const Polygon& b) {
  return a.exterior == b.exterior && a.holes == b.holes;
}

bool operator==(const MultiPoint& a, const MultiPoint& b) { return a.points == b.points; }

bool operator==(const MultiLineString& a, const MultiLineString& b) {
  return a.line_strings == b.line_strings;
}

bool operator==(const MultiPolygon& a, const MultiPolygon& b) { return a.polygons == b.polygons; }

bool operator==(const GeometryCollection& a, const GeometryCollection& b) {
  return a.geometries == b.geometries;
}

bool operator==(const Geometry& a, const Geometry& b) {
  if (a.type() != b.type()) {
    return false;
  }
  switch (a.type()) {
    case GeometryType::kPoint:
      return *a.point() == *b.point();
    case GeometryType::kLineString:
      return *a.line_string() == *b.line_string();
    case GeometryType::kPolygon:
      return *a.polygon() == *b.polygon();
    case GeometryType::kMultiPoint:
      return *a.multi_point() == *b.multi_point();
    case GeometryType::kMultiLineString:
      return *a.multi_line_string() == *b.multi_line_string();
    case GeometryType::kMultiPolygon:
      return *a.multi_polygon() == *b.multi_polygon();
    case GeometryType::kGeometryCollection:
      return *a.collection() == *b.collection();
  }
  return false;
}

bool operator==(const Envelope& a, const Envelope& b) {
  return a.min_x == b.min_x && a.max_x == b.max_x && a.min_y == b.min_y && a.max_y == b.max_y;
}

namespace {

void WriteCoordinates(std::ostream& os, const std::vector<Point>& points) {
  os << "(";
  for (size_t i = 0; i < points.size(); i++) {
    if (i > 0) {
      os << ", ";
    }
    os << points[i].x << " " << points[i].y;
    if (points[i].HasZ()) {
      os << " " << points[i].z;
    }
  }
  os << ")";
}

void WritePolygon(std::ostream& os, const Polygon& polygon) {
  os << "(";
  WriteCoordinates(os, polygon.exterior.points);
  for (const auto& hole : polygon.holes) {
    os << ", ";
    WriteCoordinates(os, hole.points);
  }
  os << ")";
}

}  // namespace

std::ostream& operator<<(std::ostream& os, const Point& p) {
  os << "POINT " << (p.HasZ() ? "Z " : "") << "(" << p.x << " " << p.y;
  if (p.HasZ()) {
    os << " " << p.z;
  }
  return os << ")";
}

std::ostream& operator<<(std::ostream& os, const Geometry& g) {
  switch (g.type()) {
    case GeometryType::kPoint:
      return os << *g.point();
    case GeometryType::kLineString:
      os << "LINESTRING ";
      WriteCoordinates(os, g.line_string()->points);
      return os;
    case GeometryType::kPolygon:
      os << "POLYGON ";
      WritePolygon(os, *g.polygon());
      return os;
    case GeometryType::kMultiPoint:
      os << "MULTIPOINT ";
      WriteCoordinates(os, g.multi_point()->points);
      return os;
    case GeometryType::kMultiLineString: {
      os << "MULTILINESTRING (";
      const auto& lines = g.multi_line_string()->line_strings;
      for (size_t i = 0; i < lines.size(); i++) {
        os << (i > 0 ? ", " : "");
        WriteCoordinates(os, lines[i].points);
      }
      return os << ")";
    }
    case GeometryType::kMultiPolygon: {
      os << "MULTIPOLYGON (";
      const auto& polygons = g.multi_polygon()->polygons;
      for (size_t i = 0; i < polygons.size(); i++) {
        os << (i > 0 ? ", " : "");
        WritePolygon(os, polygons[i]);
      }
      return os << ")";
    }
    case GeometryType::kGeometryCollection: {
      os << "GEOMETRYCOLLECTION (";
      const auto& geometries = g.collection()->geometries;
      for (size_t i = 0; i < geometries.size(); i++) {
        os << (i > 0 ? ", " : "") << geometries[i];
      }
      return os << ")";
    }
  }
  return os;
}

}  // namespace geoskit
