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
#include "context.h"
#include "conversion.h"
#include "fake_geos.h"
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

class ConversionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    testutils::ResetFakeGeos();
    ASSERT_OK(Context::Create(testutils::FakeGeosLibrary(), &ctx_));
  }

  void TearDown() override {
    ctx_.reset();
    EXPECT_EQ(0, testutils::FakeCounters()->Live());
  }

  Status RoundTrip(const Geometry& in, Geometry* out) {
    GeosObject native;
    auto s = ToNative(ctx_.get(), in, &native);
    if (!s.ok()) {
      return s;
    }
    return FromNative(ctx_.get(), native.pointer(), out);
  }

  std::unique_ptr<Context> ctx_;
};

}  // namespace

TEST_F(ConversionTest, RoundTrip) {
  Polygon withHole = Square(0, 0, 10);
  withHole.holes.push_back(Square(2, 2, 2).exterior);
  withHole.holes.push_back(Square(6, 6, 2).exterior);

  std::vector<Geometry> testCases = {
      Point(1, 2),
      Point(1, 2, 3),
      LineString({Point(0, 0), Point(1, 1), Point(2, 0)}),
      LineString({Point(0, 0, 1), Point(1, 1, 2)}),
      Square(0, 0, 1),
      withHole,
      MultiPoint(),
      MultiPoint({Point(0, 0), Point(5, 5)}),
      MultiLineString({LineString({Point(0, 0), Point(1, 1)}),
                       LineString({Point(2, 2), Point(3, 3), Point(4, 2)})}),
      MultiPolygon({Square(0, 0, 1), withHole}),
      GeometryCollection(),
      GeometryCollection({
          Point(1, 2),
          Square(0, 0, 1),
          GeometryCollection({MultiPoint({Point(7, 7)}), GeometryCollection()}),
      }),
  };
  for (const auto& in : testCases) {
    Geometry out;
    EXPECT_OK(RoundTrip(in, &out));
    EXPECT_EQ(in, out);
  }
}

TEST_F(ConversionTest, LinearRingDecodesAsLineString) {
  auto lib = ctx_->lib();
  auto seq = lib->GEOSCoordSeq_create_r(ctx_->handle(), 4, 2);
  double coords[] = {0, 0, 1, 0, 1, 1, 0, 0};
  for (unsigned int i = 0; i < 4; i++) {
    lib->GEOSCoordSeq_setXY_r(ctx_->handle(), seq, i, coords[i * 2], coords[i * 2 + 1]);
  }
  GeosObject ring(ctx_.get(), lib->GEOSGeom_createLinearRing_r(ctx_->handle(), seq));
  ASSERT_NE(nullptr, ring.pointer());

  Geometry out;
  ASSERT_OK(FromNative(ctx_.get(), ring.pointer(), &out));
  EXPECT_EQ(Geometry(LineString({Point(0, 0), Point(1, 0), Point(1, 1), Point(0, 0)})), out);

  LineString line;
  EXPECT_OK(FromNative(ctx_.get(), ring.pointer(), &line));
}

TEST_F(ConversionTest, EmptyPointIsTooFewPoints) {
  auto lib = ctx_->lib();
  auto seq = lib->GEOSCoordSeq_create_r(ctx_->handle(), 0, 2);
  GeosObject point(ctx_.get(), lib->GEOSGeom_createPoint_r(ctx_->handle(), seq));
  ASSERT_NE(nullptr, point.pointer());

  Geometry out;
  auto s = FromNative(ctx_.get(), point.pointer(), &out);
  EXPECT_TRUE(s.IsTooFewPoints()) << s.ToString();
}

TEST_F(ConversionTest, DegenerateShapesAreTooFewPoints) {
  struct {
    Geometry in;
    const char* err;
  } testCases[] = {
      {LineString(), "LineString has 0 points, needs at least 2"},
      {Polygon(), "LinearRing has 0 points, needs at least 4"},
      {MultiLineString({LineString()}), "LineString has 0 points, needs at least 2"},
      {GeometryCollection({Polygon()}), "LinearRing has 0 points, needs at least 4"},
  };
  for (const auto& c : testCases) {
    Geometry out;
    auto s = RoundTrip(c.in, &out);
    EXPECT_TRUE(s.IsTooFewPoints()) << s.ToString();
    EXPECT_ERR(s, c.err);
  }
}

TEST_F(ConversionTest, EncodeFailuresAreLibraryErrors) {
  struct {
    Geometry in;
    const char* err;
  } testCases[] = {
      {LineString({Point(0, 0)}),
       "geos error: IllegalArgumentException: point array must contain 0 or >1 elements"},
      {Polygon(LinearRing({Point(0, 0), Point(1, 0), Point(0, 0)})),
       "geos error: IllegalArgumentException: Invalid number of points in LinearRing found 3 - "
       "must be 0 or >= 4"},
      {MultiPolygon({Square(0, 0, 1), Polygon(LinearRing({Point(0, 0)}))}),
       "geos error: IllegalArgumentException: Invalid number of points in LinearRing found 1 - "
       "must be 0 or >= 4"},
  };
  for (const auto& c : testCases) {
    // A fresh session per case, so each message holds only its own errors.
    std::unique_ptr<Context> ctx;
    ASSERT_OK(Context::Create(testutils::FakeGeosLibrary(), &ctx));
    GeosObject native;
    auto s = ToNative(ctx.get(), c.in, &native);
    EXPECT_TRUE(s.IsLibraryError()) << s.ToString();
    EXPECT_ERR(s, c.err);
    EXPECT_EQ(nullptr, native.pointer());
  }
}

TEST_F(ConversionTest, TypedDecodeMismatch) {
  GeosObject native;
  ASSERT_OK(ToNative(ctx_.get(), Square(0, 0, 1), &native));

  Point point;
  EXPECT_ERR(FromNative(ctx_.get(), native.pointer(), &point),
             "geos: expected Point, got type id 3");
  LineString line;
  EXPECT_ERR(FromNative(ctx_.get(), native.pointer(), &line),
             "geos: expected LineString, got type id 3");
  GeometryCollection collection;
  EXPECT_ERR(FromNative(ctx_.get(), native.pointer(), &collection),
             "geos: expected GeometryCollection, got type id 3");
  Polygon polygon;
  EXPECT_OK(FromNative(ctx_.get(), native.pointer(), &polygon));
  EXPECT_EQ(Square(0, 0, 1), polygon);
}

TEST_F(ConversionTest, UnsupportedType) {
  auto lib = ctx_->lib();
  GeosObject unknown(ctx_.get(),
                     lib->GEOSGeom_createCollection_r(ctx_->handle(), 42, nullptr, 0));
  Geometry out;
  auto s = FromNative(ctx_.get(), unknown.pointer(), &out);
  EXPECT_TRUE(s.IsUnsupportedType()) << s.ToString();
  EXPECT_ERR(s, "geos: unsupported geometry type id 42");
}
