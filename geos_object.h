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

#include "context.h"

namespace geoskit {

// A GeosObject exclusively owns one GEOS geometry created under a Context
// and destroys it, on that Context's handle, exactly once. Ownership moves
// but is never shared. A GeosObject must not outlive its Context.
class GeosObject {
 public:
  GeosObject() : ctx_(nullptr), geom_(nullptr) {}
  // Takes ownership of geom, which may be null.
  GeosObject(Context* ctx, GEOSKIT_Geometry geom) : ctx_(ctx), geom_(geom) {}
  GeosObject(GeosObject&& other);
  GeosObject& operator=(GeosObject&& other);
  ~GeosObject() { reset(); }

  GEOSKIT_Geometry pointer() const { return geom_; }
  Context* context() const { return ctx_; }

  // Gives up ownership, e.g. when GEOS takes the geometry over as a
  // polygon ring or collection member.
  GEOSKIT_Geometry release();
  void reset();

 private:
  GeosObject(const GeosObject&) = delete;
  GeosObject& operator=(const GeosObject&) = delete;

  Context* ctx_;
  GEOSKIT_Geometry geom_;
};

// A ScopedGeosResource owns a GEOS allocation other than a geometry, such
// as a coordinate sequence or a string, and releases it with the matching
// destroy entry point.
class ScopedGeosResource {
 public:
  typedef void (*DestroyFn)(GEOSKIT_Handle, void*);

  ScopedGeosResource(Context* ctx, void* ptr, DestroyFn destroy)
      : ctx_(ctx), ptr_(ptr), destroy_(destroy) {}
  ~ScopedGeosResource() {
    if (ptr_ != nullptr) {
      destroy_(ctx_->handle(), ptr_);
    }
  }

  void* get() const { return ptr_; }
  void* release() {
    void* ptr = ptr_;
    ptr_ = nullptr;
    return ptr;
  }

 private:
  ScopedGeosResource(const ScopedGeosResource&) = delete;
  ScopedGeosResource& operator=(const ScopedGeosResource&) = delete;

  Context* const ctx_;
  void* ptr_;
  const DestroyFn destroy_;
};

}  // namespace geoskit
