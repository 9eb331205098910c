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
#include "include/geoskit/logging.h"

namespace geoskit {

Context::Context(GeosLibrary* lib, GEOSKIT_Handle handle) : lib_(lib), handle_(handle) {}

Context::~Context() {
  for (const auto& notice : notices_) {
    Logger()->debug("geos notice: {}", notice);
  }
  lib_->GEOS_finish_r(handle_);
}

Status Context::Create(GeosLibrary* lib, std::unique_ptr<Context>* ctx) {
  auto handle = lib->GEOS_init_r();
  if (handle == nullptr) {
    return Status::EngineInit("geos: could not initialize a context handle");
  }
  std::unique_ptr<Context> ret(new Context(lib, handle));
  lib->GEOSContext_setErrorMessageHandler_r(handle, ErrorHandler, ret.get());
  lib->GEOSContext_setNoticeMessageHandler_r(handle, NoticeHandler, ret.get());
  *ctx = std::move(ret);
  return Status::OK();
}

void Context::ErrorHandler(const char* msg, void* userdata) {
  auto ctx = static_cast<Context*>(userdata);
  ctx->messages_.push_back(msg);
  ctx->errors_.push_back(msg);
}

void Context::NoticeHandler(const char* msg, void* userdata) {
  auto ctx = static_cast<Context*>(userdata);
  ctx->messages_.push_back(msg);
  ctx->notices_.push_back(msg);
}

Status Context::LibraryError(size_t first) const {
  if (first >= messages_.size()) {
    return Status::LibraryError(GEOSKIT_NO_ERROR_DEFINED_MESSAGE);
  }
  std::string msg("geos error: ");
  for (size_t i = first; i < messages_.size(); i++) {
    if (i > first) {
      msg.append("; ");
    }
    msg.append(messages_[i]);
  }
  Logger()->debug("{}", msg);
  return Status::LibraryError(msg);
}

}  // namespace geoskit
