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

#include <atomic>
#include "geos_symbols.h"

namespace testutils {

// FakeGeosBehavior selects what the fake engine returns. Tests set it
// before making calls; it must not change while calls are in flight.
struct FakeGeosBehavior {
  FakeGeosBehavior()
      : init_fails(false),
        predicate_result(1),
        predicate_notice(nullptr),
        scalar_fails(false),
        valid_detail_result(1),
        valid_detail_reason(false),
        valid_detail_location(false),
        mbc_geometry(true),
        mbc_center(true),
        normalize_fails(false) {}

  // GEOS_init_r returns null.
  bool init_fails;
  // Returned by every predicate. 2 also reports an error on the handle.
  char predicate_result;
  // When set, every predicate reports this notice on the handle first.
  const char* predicate_notice;
  // Area, Length and Distance return 0 and report an error.
  bool scalar_fails;
  // Returned by isValidDetail, along with a reason string and a location
  // point when requested, whatever the result.
  char valid_detail_result;
  bool valid_detail_reason;
  bool valid_detail_location;
  // MinimumBoundingCircle returns a circle geometry and a center point only
  // when requested.
  bool mbc_geometry;
  bool mbc_center;
  // Normalize returns -1 and reports an error.
  bool normalize_fails;
};

// FakeGeosCounters counts every allocation the fake engine hands out and
// every release it receives.
struct FakeGeosCounters {
  std::atomic<int> handles_created;
  std::atomic<int> handles_finished;
  std::atomic<int> geometries_created;
  std::atomic<int> geometries_destroyed;
  std::atomic<int> coord_seqs_created;
  std::atomic<int> coord_seqs_destroyed;
  std::atomic<int> buffers_created;
  std::atomic<int> buffers_freed;
  std::atomic<int> prepared_created;
  std::atomic<int> prepared_destroyed;

  // Live returns the number of allocations not yet released.
  int Live() const;
};

// FakeGeosLibrary returns an engine table implementing, in memory, the
// entry points the unit tests drive. Entry points it does not implement
// are null.
//
// The fake keeps geometries in a simple tree: it computes areas, lengths,
// point distances and envelopes. Union returns a collection of copies of
// its inputs, failing with "union: negative x <x>" if an input Point has a
// negative x. Intersection returns an empty Polygon when its inputs'
// envelopes are disjoint and a copy of its first input otherwise. Buffer
// of a zero-area Polygon by 0 returns an empty Polygon. Polygonize returns
// a GeometryCollection of copies of its inputs.
geoskit::GeosLibrary* FakeGeosLibrary();

FakeGeosBehavior* FakeBehavior();
FakeGeosCounters* FakeCounters();

// ResetFakeGeos restores the default behavior and zeroes the counters.
void ResetFakeGeos();

}  // namespace testutils
