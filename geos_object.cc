// Copyright 2020 The Cockroach Authors.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "geos_object.h"

namespace geoskit {

GeosObject::GeosObject(GeosObject&& other) : ctx_(other.ctx_), geom_(other.geom_) {
  other.geom_ = nullptr;
}

GeosObject& GeosObject::operator=(GeosObject&& other) {
  if (this != &other) {
    reset();
    ctx_ = other.ctx_;
    geom_ = other.geom_;
    other.geom_ = nullptr;
  }
  return *this;
}

GEOSKIT_Geometry GeosObject::release() {
  auto geom = geom_;
  geom_ = nullptr;
  return geom;
}

void GeosObject::reset() {
  if (geom_ != nullptr) {
    ctx_->lib()->GEOSGeom_destroy_r(ctx_->handle(), geom_);
    geom_ = nullptr;
  }
}

}  // namespace geoskit
