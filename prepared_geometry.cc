// Copyright 2020 The Cockroach Authors.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "context.h"
#include "conversion.h"
#include "geos_object.h"
#include "include/geoskit/geoskit.h"

namespace geoskit {

PreparedGeometry::PreparedGeometry(std::unique_ptr<Context> ctx, std::unique_ptr<GeosObject> base,
                                   void* prepared)
    : ctx_(std::move(ctx)), base_(std::move(base)), prepared_(prepared) {}

PreparedGeometry::~PreparedGeometry() {
  ctx_->lib()->GEOSPreparedGeom_destroy_r(ctx_->handle(), prepared_);
}

Status PreparedGeometry::Evaluate(PredicateFn fn, const Geometry& other, bool* ret) const {
  // The session outlives this call, so only messages reported during it
  // belong in the result.
  size_t first = ctx_->messages().size();
  GeosObject geom;
  auto s = ToNative(ctx_.get(), other, &geom);
  if (s.IsLibraryError()) {
    return ctx_->LibraryError(first);
  }
  if (!s.ok()) {
    return s;
  }
  switch (fn(ctx_->handle(), prepared_, geom.pointer())) {
    case 0:
      *ret = false;
      return Status::OK();
    case 1:
      *ret = true;
      return Status::OK();
  }
  return ctx_->LibraryError(first);
}

Status PreparedGeometry::Contains(const Geometry& other, bool* ret) const {
  return Evaluate(ctx_->lib()->GEOSPreparedContains_r, other, ret);
}

Status PreparedGeometry::ContainsProperly(const Geometry& other, bool* ret) const {
  return Evaluate(ctx_->lib()->GEOSPreparedContainsProperly_r, other, ret);
}

Status PreparedGeometry::CoveredBy(const Geometry& other, bool* ret) const {
  return Evaluate(ctx_->lib()->GEOSPreparedCoveredBy_r, other, ret);
}

Status PreparedGeometry::Covers(const Geometry& other, bool* ret) const {
  return Evaluate(ctx_->lib()->GEOSPreparedCovers_r, other, ret);
}

Status PreparedGeometry::Crosses(const Geometry& other, bool* ret) const {
  return Evaluate(ctx_->lib()->GEOSPreparedCrosses_r, other, ret);
}

Status PreparedGeometry::Disjoint(const Geometry& other, bool* ret) const {
  return Evaluate(ctx_->lib()->GEOSPreparedDisjoint_r, other, ret);
}

Status PreparedGeometry::Intersects(const Geometry& other, bool* ret) const {
  return Evaluate(ctx_->lib()->GEOSPreparedIntersects_r, other, ret);
}

Status PreparedGeometry::Overlaps(const Geometry& other, bool* ret) const {
  return Evaluate(ctx_->lib()->GEOSPreparedOverlaps_r, other, ret);
}

Status PreparedGeometry::Touches(const Geometry& other, bool* ret) const {
  return Evaluate(ctx_->lib()->GEOSPreparedTouches_r, other, ret);
}

Status PreparedGeometry::Within(const Geometry& other, bool* ret) const {
  return Evaluate(ctx_->lib()->GEOSPreparedWithin_r, other, ret);
}

Status MakePrepared(GeosLibrary* lib, const Geometry& g, std::unique_ptr<PreparedGeometry>* ret) {
  std::unique_ptr<Context> ctx;
  auto s = Context::Create(lib, &ctx);
  if (!s.ok()) {
    return s;
  }
  std::unique_ptr<GeosObject> base(new GeosObject());
  s = ToNative(ctx.get(), g, base.get());
  if (!s.ok()) {
    return s;
  }
  auto prepared = lib->GEOSPrepare_r(ctx->handle(), base->pointer());
  if (prepared == nullptr) {
    return ctx->LibraryError();
  }
  ret->reset(new PreparedGeometry(std::move(ctx), std::move(base), prepared));
  return Status::OK();
}

}  // namespace geoskit
