// Copyright 2020 The Cockroach Authors.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include <gtest/gtest.h>
#include <sstream>
#include "include/geoskit/geometry.h"

using namespace geoskit;

namespace {

Polygon Square(double x, double y, double size) {
  return Polygon(LinearRing({
      Point(x, y),
      Point(x + size, y),
      Point(x + size, y + size),
      Point(x, y + size),
      Point(x, y),
  }));
}

}  // namespace

TEST(Geoskit, PointEquality) {
  EXPECT_EQ(Point(1, 2), Point(1, 2));
  EXPECT_NE(Point(1, 2), Point(2, 1));
  EXPECT_FALSE(Point(1, 2).HasZ());
  EXPECT_TRUE(Point(1, 2, 3).HasZ());
  EXPECT_NE(Point(1, 2), Point(1, 2, 3));
  EXPECT_EQ(Point(1, 2, 3), Point(1, 2, 3));
  EXPECT_NE(Point(1, 2, 3), Point(1, 2, 4));
}

TEST(Geoskit, GeometryAccessors) {
  Geometry point = Point(1, 2);
  EXPECT_EQ(GeometryType::kPoint, point.type());
  ASSERT_NE(nullptr, point.point());
  EXPECT_EQ(Point(1, 2), *point.point());
  EXPECT_EQ(nullptr, point.polygon());
  EXPECT_EQ(nullptr, point.collection());

  Geometry polygon = Square(0, 0, 1);
  EXPECT_EQ(GeometryType::kPolygon, polygon.type());
  ASSERT_NE(nullptr, polygon.polygon());
  EXPECT_EQ(5u, polygon.polygon()->exterior.points.size());
  EXPECT_EQ(nullptr, polygon.point());

  Geometry empty;
  EXPECT_EQ(GeometryType::kGeometryCollection, empty.type());
  ASSERT_NE(nullptr, empty.collection());
  EXPECT_TRUE(empty.collection()->geometries.empty());
}

TEST(Geoskit, GeometryEquality) {
  GeometryCollection nested({
      Point(1, 2),
      LineString({Point(0, 0), Point(1, 1)}),
      GeometryCollection({MultiPolygon({Square(0, 0, 1), Square(5, 5, 2)})}),
  });
  GeometryCollection same = nested;
  EXPECT_EQ(Geometry(nested), Geometry(same));

  GeometryCollection different({
      Point(1, 2),
      LineString({Point(0, 0), Point(1, 1)}),
      GeometryCollection({MultiPolygon({Square(0, 0, 1), Square(5, 5, 3)})}),
  });
  EXPECT_NE(Geometry(nested), Geometry(different));

  EXPECT_NE(Geometry(MultiPoint({Point(0, 0)})), Geometry(Point(0, 0)));
  EXPECT_NE(Geometry(LineString()), Geometry(MultiLineString()));
}

TEST(Geoskit, EnvelopeToGeometry) {
  EXPECT_EQ(Geometry(Point(3, 4)), Envelope(3, 3, 4, 4).ToGeometry());
  EXPECT_EQ(Geometry(Square(1, 2, 3)), Envelope(1, 4, 2, 5).ToGeometry());
}

TEST(Geoskit, GeometryTypeNames) {
  EXPECT_STREQ("Point", GeometryTypeName(GeometryType::kPoint));
  EXPECT_STREQ("MultiPolygon", GeometryTypeName(GeometryType::kMultiPolygon));
  EXPECT_STREQ("GeometryCollection", GeometryTypeName(GeometryType::kGeometryCollection));
}

TEST(Geoskit, GeometryDebugString) {
  std::ostringstream os;
  os << Geometry(GeometryCollection({Point(1, 2), LineString({Point(0, 0), Point(1, 1, 2)})}));
  EXPECT_EQ("GEOMETRYCOLLECTION (POINT (1 2), LINESTRING (0 0, 1 1 2))", os.str());
}
