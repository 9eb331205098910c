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
#include "fake_geos.h"
#include "geos_object.h"
#include "testutils.h"

using namespace geoskit;

namespace {

// Makes the fake engine report one error on ctx.
void ReportFakeError(Context* ctx) {
  testutils::FakeBehavior()->predicate_result = 2;
  ctx->lib()->GEOSisValid_r(ctx->handle(), nullptr);
}

}  // namespace

TEST(Geoskit, ContextCreateAndFinish) {
  testutils::ResetFakeGeos();
  {
    std::unique_ptr<Context> ctx;
    ASSERT_OK(Context::Create(testutils::FakeGeosLibrary(), &ctx));
    ASSERT_NE(nullptr, ctx->handle());
    EXPECT_EQ(testutils::FakeGeosLibrary(), ctx->lib());
    EXPECT_TRUE(ctx->errors().empty());
    EXPECT_EQ(1, testutils::FakeCounters()->handles_created.load());
    EXPECT_EQ(0, testutils::FakeCounters()->handles_finished.load());
  }
  EXPECT_EQ(1, testutils::FakeCounters()->handles_finished.load());
}

TEST(Geoskit, ContextEngineInitFailure) {
  testutils::ResetFakeGeos();
  testutils::FakeBehavior()->init_fails = true;
  std::unique_ptr<Context> ctx;
  auto s = Context::Create(testutils::FakeGeosLibrary(), &ctx);
  EXPECT_TRUE(s.IsEngineInit()) << s.ToString();
  EXPECT_EQ(nullptr, ctx.get());
}

TEST(Geoskit, ContextLibraryError) {
  testutils::ResetFakeGeos();
  std::unique_ptr<Context> ctx;
  ASSERT_OK(Context::Create(testutils::FakeGeosLibrary(), &ctx));

  EXPECT_ERR(ctx->LibraryError(), GEOSKIT_NO_ERROR_DEFINED_MESSAGE);

  ReportFakeError(ctx.get());
  ASSERT_EQ(1u, ctx->errors().size());
  EXPECT_TRUE(ctx->LibraryError().IsLibraryError());
  EXPECT_ERR(ctx->LibraryError(), "geos error: IllegalArgumentException: fake predicate failure");

  ReportFakeError(ctx.get());
  EXPECT_ERR(ctx->LibraryError(),
             "geos error: IllegalArgumentException: fake predicate failure; "
             "IllegalArgumentException: fake predicate failure");

  EXPECT_ERR(ctx->LibraryError(1),
             "geos error: IllegalArgumentException: fake predicate failure");
  EXPECT_ERR(ctx->LibraryError(2), GEOSKIT_NO_ERROR_DEFINED_MESSAGE);
  EXPECT_EQ(2u, ctx->messages().size());
}

TEST(Geoskit, ContextNoticesJoinTheLog) {
  testutils::ResetFakeGeos();
  std::unique_ptr<Context> ctx;
  ASSERT_OK(Context::Create(testutils::FakeGeosLibrary(), &ctx));

  testutils::FakeBehavior()->predicate_result = 0;
  testutils::FakeBehavior()->predicate_notice = "Ring Self-intersection at or near point 1 1";
  ctx->lib()->GEOSisValid_r(ctx->handle(), nullptr);
  ASSERT_EQ(1u, ctx->notices().size());
  EXPECT_TRUE(ctx->errors().empty());
  EXPECT_ERR(ctx->LibraryError(), "geos error: Ring Self-intersection at or near point 1 1");

  // Errors and notices share one log, in the order GEOS reported them.
  ReportFakeError(ctx.get());
  EXPECT_EQ(3u, ctx->messages().size());
  EXPECT_EQ(1u, ctx->errors().size());
  EXPECT_EQ(2u, ctx->notices().size());
  EXPECT_ERR(ctx->LibraryError(),
             "geos error: Ring Self-intersection at or near point 1 1; "
             "Ring Self-intersection at or near point 1 1; "
             "IllegalArgumentException: fake predicate failure");
}

TEST(Geoskit, ContextErrorsStayOnTheirHandle) {
  testutils::ResetFakeGeos();
  std::unique_ptr<Context> a;
  std::unique_ptr<Context> b;
  ASSERT_OK(Context::Create(testutils::FakeGeosLibrary(), &a));
  ASSERT_OK(Context::Create(testutils::FakeGeosLibrary(), &b));
  ReportFakeError(a.get());
  EXPECT_EQ(1u, a->errors().size());
  EXPECT_TRUE(b->errors().empty());
  EXPECT_TRUE(a->notices().empty());
}

TEST(Geoskit, GeosObjectDestroysOnce) {
  testutils::ResetFakeGeos();
  auto counters = testutils::FakeCounters();
  {
    std::unique_ptr<Context> ctx;
    ASSERT_OK(Context::Create(testutils::FakeGeosLibrary(), &ctx));
    auto lib = ctx->lib();
    auto newPoint = [&]() {
      auto seq = lib->GEOSCoordSeq_create_r(ctx->handle(), 1, 2);
      lib->GEOSCoordSeq_setXY_r(ctx->handle(), seq, 0, 1, 2);
      return lib->GEOSGeom_createPoint_r(ctx->handle(), seq);
    };

    {
      GeosObject a(ctx.get(), newPoint());
      EXPECT_EQ(1, counters->geometries_created.load());
      GeosObject b(std::move(a));
      EXPECT_EQ(nullptr, a.pointer());
      EXPECT_NE(nullptr, b.pointer());
      GeosObject c;
      c = std::move(b);
      EXPECT_EQ(nullptr, b.pointer());
      EXPECT_EQ(ctx.get(), c.context());
    }
    EXPECT_EQ(1, counters->geometries_destroyed.load());

    {
      GeosObject a(ctx.get(), newPoint());
      GeosObject b(ctx.get(), newPoint());
      // Assigning over a live object destroys what it held.
      a = std::move(b);
      EXPECT_EQ(2, counters->geometries_destroyed.load());
    }
    EXPECT_EQ(3, counters->geometries_destroyed.load());

    GEOSKIT_Geometry released = nullptr;
    {
      GeosObject a(ctx.get(), newPoint());
      released = a.release();
    }
    EXPECT_EQ(3, counters->geometries_destroyed.load());
    GeosObject(ctx.get(), released);
    EXPECT_EQ(4, counters->geometries_destroyed.load());
  }
  EXPECT_EQ(0, counters->Live());
}
