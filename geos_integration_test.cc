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
#include <cmath>
#include <string>
#include <thread>
#include <vector>
#include "context.h"
#include "conversion.h"
#include "include/geoskit/geoskit.h"
#include "testutils.h"

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

Polygon Bowtie() {
  return Polygon(
      LinearRing({Point(0, 0), Point(2, 2), Point(2, 0), Point(0, 2), Point(0, 0)}));
}

}  // namespace

TEST(GeoskitIntegration, RoundTrip) {
  GEOSKIT_REQUIRE_GEOS(lib);
  Polygon withHole = Square(0, 0, 10);
  withHole.holes.push_back(Square(2, 2, 2).exterior);
  std::vector<Geometry> testCases = {
      Point(1, 2),
      Point(1, 2, 3),
      LineString({Point(0, 0), Point(1, 1), Point(2, 0)}),
      withHole,
      MultiPoint({Point(0, 0), Point(5, 5)}),
      MultiLineString({LineString({Point(0, 0), Point(1, 1)})}),
      MultiPolygon({Square(0, 0, 1), Square(5, 5, 1)}),
      GeometryCollection({Point(1, 2), GeometryCollection({Square(0, 0, 1)})}),
  };
  std::unique_ptr<Context> ctx;
  ASSERT_OK(Context::Create(lib, &ctx));
  for (const auto& in : testCases) {
    GeosObject native;
    ASSERT_OK(ToNative(ctx.get(), in, &native));
    Geometry out;
    ASSERT_OK(FromNative(ctx.get(), native.pointer(), &out));
    EXPECT_EQ(in, out);
  }
}

TEST(GeoskitIntegration, Measurements) {
  GEOSKIT_REQUIRE_GEOS(lib);
  double value = 0;
  ASSERT_OK(Area(lib, Square(0, 0, 2), &value));
  EXPECT_DOUBLE_EQ(4, value);
  ASSERT_OK(Length(lib, LineString({Point(0, 0), Point(3, 4)}), &value));
  EXPECT_DOUBLE_EQ(5, value);
  ASSERT_OK(Distance(lib, Point(0, 0), Point(3, 4), &value));
  EXPECT_DOUBLE_EQ(5, value);
  ASSERT_OK(HausdorffDistance(lib, LineString({Point(0, 0), Point(2, 0)}),
                              LineString({Point(0, 1), Point(2, 1)}), &value));
  EXPECT_DOUBLE_EQ(1, value);

  std::vector<Point> nearest;
  ASSERT_OK(NearestPoints(lib, Square(0, 0, 1), Point(3, 0.5), &nearest));
  ASSERT_EQ(2u, nearest.size());
  EXPECT_DOUBLE_EQ(1, nearest[0].x);
  EXPECT_DOUBLE_EQ(0.5, nearest[0].y);
  EXPECT_EQ(Point(3, 0.5), nearest[1]);
}

TEST(GeoskitIntegration, PredicateProperties) {
  GEOSKIT_REQUIRE_GEOS(lib);
  std::vector<Geometry> shapes = {
      Point(0.5, 0.5),
      Point(9, 9),
      Square(0, 0, 1),
      Square(0.5, 0.5, 1),
      LineString({Point(-1, 0.5), Point(2, 0.5)}),
  };
  for (const auto& a : shapes) {
    for (const auto& b : shapes) {
      bool ab = false;
      bool ba = false;
      ASSERT_OK(Intersects(lib, a, b, &ab));
      ASSERT_OK(Intersects(lib, b, a, &ba));
      EXPECT_EQ(ab, ba) << a << " / " << b;

      bool contains = false;
      ASSERT_OK(Contains(lib, a, b, &contains));
      if (contains) {
        EXPECT_TRUE(ab) << a << " / " << b;
      }
    }
  }

  bool got = false;
  ASSERT_OK(Relate(lib, Square(0, 0, 1), Square(5, 5, 1), "FF*FF****", &got));
  EXPECT_TRUE(got);
  ASSERT_OK(Relate(lib, Square(0, 0, 1), Square(0, 0, 1), "T*F**FFF*", &got));
  EXPECT_TRUE(got);
  ASSERT_OK(Relate(lib, Square(0, 0, 1), Square(5, 5, 1), "T*F**FFF*", &got));
  EXPECT_FALSE(got);

  std::string matrix;
  ASSERT_OK(Relate(lib, Square(0, 0, 1), Square(5, 5, 1), &matrix));
  EXPECT_EQ("FF2FF1212", matrix);
}

TEST(GeoskitIntegration, Validity) {
  GEOSKIT_REQUIRE_GEOS(lib);
  bool valid = true;
  ASSERT_OK(IsValid(lib, Bowtie(), &valid));
  EXPECT_FALSE(valid);

  ValidityDetail detail;
  ASSERT_OK(IsValidDetail(lib, Bowtie(), false, &detail));
  EXPECT_FALSE(detail.valid);
  EXPECT_TRUE(detail.has_reason);
  EXPECT_FALSE(detail.reason.empty());
  EXPECT_TRUE(detail.has_location);
  EXPECT_EQ(Geometry(Point(1, 1)), detail.location);

  ASSERT_OK(IsValidDetail(lib, Square(0, 0, 1), false, &detail));
  EXPECT_TRUE(detail.valid);
  EXPECT_FALSE(detail.has_reason);

  std::string reason;
  ASSERT_OK(IsValidReason(lib, Square(0, 0, 1), &reason));
  EXPECT_EQ("Valid Geometry", reason);

  Geometry fixed;
  ASSERT_OK(MakeValid(lib, Bowtie(), &fixed));
  ASSERT_OK(IsValid(lib, fixed, &valid));
  EXPECT_TRUE(valid);
  double area = 0;
  ASSERT_OK(Area(lib, fixed, &area));
  EXPECT_DOUBLE_EQ(2, area);
}

TEST(GeoskitIntegration, OptionalResults) {
  GEOSKIT_REQUIRE_GEOS(lib);
  std::unique_ptr<Geometry> result;
  ASSERT_OK(Intersection(lib, Square(0, 0, 1), Square(5, 5, 1), &result));
  EXPECT_EQ(nullptr, result.get());

  ASSERT_OK(Intersection(lib, Square(0, 0, 2), Square(1, 1, 2), &result));
  ASSERT_NE(nullptr, result.get());
  double area = 0;
  ASSERT_OK(Area(lib, *result, &area));
  EXPECT_DOUBLE_EQ(1, area);

  ASSERT_OK(Difference(lib, Square(0, 0, 1), Square(-1, -1, 5), &result));
  EXPECT_EQ(nullptr, result.get());

  Polygon collapsed(LinearRing({Point(0, 0), Point(1, 1), Point(2, 2), Point(0, 0)}));
  ASSERT_OK(Buffer(lib, collapsed, 0, &result));
  EXPECT_EQ(nullptr, result.get());

  ASSERT_OK(Buffer(lib, Point(0, 0), 1, &result));
  ASSERT_NE(nullptr, result.get());
  ASSERT_EQ(GeometryType::kPolygon, result->type());
  // Each quadrant is approximated by kDefaultQuadrantSegments segments.
  EXPECT_EQ(size_t(4 * kDefaultQuadrantSegments + 1), result->polygon()->exterior.points.size());

  BufferStyle style;
  style.end_cap = BufferEndCap::kFlat;
  ASSERT_OK(BufferWithStyle(lib, LineString({Point(0, 0), Point(10, 0)}), 1, style, &result));
  ASSERT_NE(nullptr, result.get());
  ASSERT_OK(Area(lib, *result, &area));
  EXPECT_DOUBLE_EQ(20, area);

  ASSERT_OK(OffsetCurve(lib, LineString({Point(0, 0), Point(10, 0)}), 1, OffsetCurveStyle(),
                        &result));
  ASSERT_NE(nullptr, result.get());
  double length = 0;
  ASSERT_OK(Length(lib, *result, &length));
  EXPECT_DOUBLE_EQ(10, length);
}

TEST(GeoskitIntegration, Envelope) {
  GEOSKIT_REQUIRE_GEOS(lib);
  Envelope env;
  ASSERT_OK(GetEnvelope(lib, Point(3, 4), &env));
  EXPECT_EQ(Envelope(3, 3, 4, 4), env);
  EXPECT_EQ(Geometry(Point(3, 4)), env.ToGeometry());

  ASSERT_OK(GetEnvelope(lib, Polygon(LinearRing({Point(1, 1), Point(4, 2), Point(2, 5),
                                                 Point(1, 1)})),
                        &env));
  EXPECT_EQ(Envelope(1, 4, 1, 5), env);
}

TEST(GeoskitIntegration, Constructions) {
  GEOSKIT_REQUIRE_GEOS(lib);
  Point p;
  ASSERT_OK(Centroid(lib, Square(0, 0, 2), &p));
  EXPECT_EQ(Point(1, 1), p);
  ASSERT_OK(PointOnSurface(lib, Square(0, 0, 2), &p));
  bool within = false;
  ASSERT_OK(IsWithin(lib, p, Square(0, 0, 2), &within));
  EXPECT_TRUE(within);

  Circle circle;
  ASSERT_OK(MinimumBoundingCircle(lib, Square(0, 0, 2), &circle));
  EXPECT_DOUBLE_EQ(1, circle.center.x);
  EXPECT_DOUBLE_EQ(1, circle.center.y);
  EXPECT_NEAR(std::sqrt(2.0), circle.radius, 1e-9);

  Geometry hull;
  ASSERT_OK(ConvexHull(lib, MultiPoint({Point(0, 0), Point(2, 0), Point(1, 1), Point(2, 2),
                                        Point(0, 2)}),
                       &hull));
  double area = 0;
  ASSERT_OK(Area(lib, hull, &area));
  EXPECT_DOUBLE_EQ(4, area);

  Geometry merged;
  ASSERT_OK(LineMerge(lib, MultiLineString({LineString({Point(0, 0), Point(1, 0)}),
                                             LineString({Point(1, 0), Point(2, 0)})}),
                      &merged));
  ASSERT_EQ(GeometryType::kLineString, merged.type());
  EXPECT_EQ(3u, merged.line_string()->points.size());

  GeometryCollection polygons;
  std::vector<Geometry> edges = {
      LineString({Point(0, 0), Point(1, 0), Point(1, 1)}),
      LineString({Point(1, 1), Point(0, 1), Point(0, 0)}),
  };
  ASSERT_OK(Polygonize(lib, edges, &polygons));
  ASSERT_EQ(1u, polygons.geometries.size());
  ASSERT_OK(Area(lib, polygons.geometries[0], &area));
  EXPECT_DOUBLE_EQ(1, area);

  Geometry normalized;
  ASSERT_OK(Normalized(lib, Square(0, 0, 1), &normalized));
  bool equal = false;
  ASSERT_OK(IsTopologicallyEquivalent(lib, Square(0, 0, 1), normalized, &equal));
  EXPECT_TRUE(equal);
}

TEST(GeoskitIntegration, ConcurrentUnion) {
  GEOSKIT_REQUIRE_GEOS(lib);
  const int kThreads = 100;
  std::vector<Status> statuses(kThreads);
  std::vector<Geometry> results(kThreads);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([lib, i, &statuses, &results] {
      statuses[i] = Union(lib, Square(i, 0, 1), Square(i + 0.5, 0, 1), &results[i]);
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  for (int i = 0; i < kThreads; i++) {
    ASSERT_OK(statuses[i]);
    double area = 0;
    ASSERT_OK(Area(lib, results[i], &area));
    EXPECT_DOUBLE_EQ(1.5, area);
  }
}

TEST(GeoskitIntegration, PreparedGeometry) {
  GEOSKIT_REQUIRE_GEOS(lib);
  std::unique_ptr<PreparedGeometry> prepared;
  ASSERT_OK(MakePrepared(lib, Square(0, 0, 4), &prepared));
  bool got = false;
  ASSERT_OK(prepared->Contains(Point(1, 1), &got));
  EXPECT_TRUE(got);
  ASSERT_OK(prepared->Disjoint(Point(9, 9), &got));
  EXPECT_TRUE(got);
  ASSERT_OK(prepared->Intersects(Square(3, 3, 2), &got));
  EXPECT_TRUE(got);
  ASSERT_OK(prepared->Within(Square(-1, -1, 6), &got));
  EXPECT_TRUE(got);
}

TEST(GeoskitIntegration, MoreConstructions) {
  GEOSKIT_REQUIRE_GEOS(lib);
  bool got = false;
  ASSERT_OK(IsEmpty(lib, GeometryCollection(), &got));
  EXPECT_TRUE(got);
  ASSERT_OK(IsRing(lib, LineString(Square(0, 0, 1).exterior.points), &got));
  EXPECT_TRUE(got);

  double value = 0;
  ASSERT_OK(HausdorffDistanceDensify(lib, LineString({Point(0, 0), Point(2, 0)}),
                                     LineString({Point(0, 1), Point(2, 1)}), 0.5, &value));
  EXPECT_DOUBLE_EQ(1, value);

  std::unique_ptr<Geometry> optional;
  ASSERT_OK(SymmetricDifference(lib, Square(0, 0, 2), Square(1, 0, 2), &optional));
  ASSERT_NE(nullptr, optional.get());
  ASSERT_OK(Area(lib, *optional, &value));
  EXPECT_DOUBLE_EQ(4, value);

  Geometry result;
  ASSERT_OK(UnaryUnion(lib, MultiPolygon({Square(0, 0, 2), Square(1, 0, 2)}), &result));
  ASSERT_OK(Area(lib, result, &value));
  EXPECT_DOUBLE_EQ(6, value);

  ASSERT_OK(MinimumRotatedRectangle(lib, Square(0, 0, 2), &result));
  ASSERT_OK(Area(lib, result, &value));
  EXPECT_NEAR(4, value, 1e-9);

  LineString width;
  ASSERT_OK(MinimumWidth(lib, Polygon(LinearRing({Point(0, 0), Point(4, 0), Point(4, 1),
                                                  Point(0, 1), Point(0, 0)})),
                         &width));
  ASSERT_OK(Length(lib, width, &value));
  EXPECT_DOUBLE_EQ(1, value);

  ASSERT_OK(ConcaveHull(lib, MultiPoint({Point(0, 0), Point(2, 0), Point(2, 2), Point(0, 2)}), 1,
                        false, &result));
  ASSERT_OK(Area(lib, result, &value));
  EXPECT_DOUBLE_EQ(4, value);

  // Opposed directions do not merge.
  ASSERT_OK(LineMergeDirected(lib, MultiLineString({LineString({Point(0, 0), Point(1, 0)}),
                                                    LineString({Point(2, 0), Point(1, 0)})}),
                              &result));
  EXPECT_EQ(GeometryType::kMultiLineString, result.type());

  LineString zigzag({Point(0, 0), Point(1, 0.01), Point(2, 0), Point(3, 0.01), Point(4, 0)});
  ASSERT_OK(Simplify(lib, zigzag, 0.1, &result));
  EXPECT_EQ(Geometry(LineString({Point(0, 0), Point(4, 0)})), result);
  ASSERT_OK(TopologyPreserveSimplify(lib, zigzag, 0.1, &result));
  EXPECT_EQ(Geometry(LineString({Point(0, 0), Point(4, 0)})), result);

  ASSERT_OK(Snap(lib, Point(0.05, 0), Point(0, 0), 0.1, &result));
  EXPECT_EQ(Geometry(Point(0, 0)), result);

  Polygon bowtie(
      LinearRing({Point(0, 0), Point(2, 2), Point(2, 0), Point(0, 2), Point(0, 0)}));
  ASSERT_OK(MakeValid(lib, bowtie, MakeValidMethod::Structure(false), &result));
  ASSERT_OK(IsValid(lib, result, &got));
  EXPECT_TRUE(got);
}
