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

#include <cmath>
#include <iosfwd>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace geoskit {

// GeometryType enumerates the closed set of shapes a Geometry can hold.
enum class GeometryType {
  kPoint,
  kLineString,
  kPolygon,
  kMultiPoint,
  kMultiLineString,
  kMultiPolygon,
  kGeometryCollection,
};

const char* GeometryTypeName(GeometryType type);

// A Point is a 2D coordinate with an optional z. A missing z is NaN.
struct Point {
  Point() : x(0), y(0), z(std::numeric_limits<double>::quiet_NaN()) {}
  Point(double x, double y) : x(x), y(y), z(std::numeric_limits<double>::quiet_NaN()) {}
  Point(double x, double y, double z) : x(x), y(y), z(z) {}

  bool HasZ() const { return !std::isnan(z); }

  double x;
  double y;
  double z;
};

struct LineString {
  LineString() {}
  explicit LineString(std::vector<Point> points) : points(std::move(points)) {}

  std::vector<Point> points;
};

// A LinearRing is a closed LineString. It only appears as a Polygon ring.
struct LinearRing {
  LinearRing() {}
  explicit LinearRing(std::vector<Point> points) : points(std::move(points)) {}

  std::vector<Point> points;
};

struct Polygon {
  Polygon() {}
  explicit Polygon(LinearRing exterior, std::vector<LinearRing> holes = std::vector<LinearRing>())
      : exterior(std::move(exterior)), holes(std::move(holes)) {}

  LinearRing exterior;
  std::vector<LinearRing> holes;
};

struct MultiPoint {
  MultiPoint() {}
  explicit MultiPoint(std::vector<Point> points) : points(std::move(points)) {}

  std::vector<Point> points;
};

struct MultiLineString {
  MultiLineString() {}
  explicit MultiLineString(std::vector<LineString> line_strings)
      : line_strings(std::move(line_strings)) {}

  std::vector<LineString> line_strings;
};

struct MultiPolygon {
  MultiPolygon() {}
  explicit MultiPolygon(std::vector<Polygon> polygons) : polygons(std::move(polygons)) {}

  std::vector<Polygon> polygons;
};

struct GeometryCollection;

// A Geometry is an immutable value holding exactly one of the shapes above.
// Consumers switch on type() and then read the matching accessor; the
// accessor for any other shape returns nullptr.
class Geometry {
 public:
  // The default Geometry is an empty GeometryCollection.
  Geometry();
  Geometry(const Point& point);
  Geometry(const LineString& line_string);
  Geometry(const Polygon& polygon);
  Geometry(const MultiPoint& multi_point);
  Geometry(const MultiLineString& multi_line_string);
  Geometry(const MultiPolygon& multi_polygon);
  Geometry(const GeometryCollection& collection);

  GeometryType type() const { return type_; }

  const Point* point() const;
  const LineString* line_string() const;
  const Polygon* polygon() const;
  const MultiPoint* multi_point() const;
  const MultiLineString* multi_line_string() const;
  const MultiPolygon* multi_polygon() const;
  const GeometryCollection* collection() const;

 private:
  template <typename T> const T* get(GeometryType type) const {
    return type_ == type ? static_cast<const T*>(value_.get()) : nullptr;
  }

  GeometryType type_;
  std::shared_ptr<const void> value_;
};

// A GeometryCollection holds any number of geometries of any shape,
// including other collections.
struct GeometryCollection {
  GeometryCollection() {}
  explicit GeometryCollection(std::vector<Geometry> geometries)
      : geometries(std::move(geometries)) {}

  std::vector<Geometry> geometries;
};

// An Envelope is an axis-aligned bounding box.
struct Envelope {
  Envelope() : min_x(0), max_x(0), min_y(0), max_y(0) {}
  Envelope(double min_x, double max_x, double min_y, double max_y)
      : min_x(min_x), max_x(max_x), min_y(min_y), max_y(max_y) {}

  // ToGeometry returns the box as a Point when it is degenerate in both
  // axes, and as a closed rectangular Polygon otherwise.
  Geometry ToGeometry() const;

  double min_x;
  double max_x;
  double min_y;
  double max_y;
};

struct Circle {
  Circle() : radius(0) {}
  Circle(const Point& center, double radius) : center(center), radius(radius) {}

  Point center;
  double radius;
};

// ValidityDetail is the result of IsValidDetail. When valid is false, the
// reason and the location at which GEOS found the problem are each present
// only if GEOS reported them.
struct ValidityDetail {
  ValidityDetail() : valid(true), has_reason(false), has_location(false) {}

  bool valid;
  bool has_reason;
  std::string reason;
  bool has_location;
  Geometry location;
};

// Points compare by coordinates; two missing z values are equal.
bool operator==(const Point& a, const Point& b);
bool operator==(const LineString& a, const LineString& b);
bool operator==(const LinearRing& a, const LinearRing& b);
bool operator==(const Polygon& a, const Polygon& b);
bool operator==(const MultiPoint& a, const MultiPoint& b);
bool operator==(const MultiLineString& a, const MultiLineString& b);
bool operator==(const MultiPolygon& a, const MultiPolygon& b);
bool operator==(const GeometryCollection& a, const GeometryCollection& b);
bool operator==(const Geometry& a, const Geometry& b);
bool operator==(const Envelope& a, const Envelope& b);

inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }
inline bool operator!=(const Geometry& a, const Geometry& b) { return !(a == b); }

// Debug representations, used by test failure output.
std::ostream& operator<<(std::ostream& os, const Point& p);
std::ostream& operator<<(std::ostream& os, const Geometry& g);

}  // namespace geoskit
