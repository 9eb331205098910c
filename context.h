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

#include <memory>
#include <string>
#include <vector>
#include "geos_symbols.h"
#include "include/geoskit/status.h"

#define GEOSKIT_NO_ERROR_DEFINED_MESSAGE "geos: returned invalid result but error not populated"

namespace geoskit {

// A Context owns one GEOS session handle. Error and notice messages GEOS
// reports on the handle are appended to this Context's log; nothing is
// registered process-wide, so Contexts on different threads never see each
// other's messages.
//
// Every geometry created under a Context must be destroyed before the
// Context. A Context is not safe for concurrent use.
class Context {
 public:
  // Create initializes a new GEOS session on lib. Returns an EngineInit
  // status if GEOS could not allocate one.
  static Status Create(GeosLibrary* lib, std::unique_ptr<Context>* ctx);

  ~Context();

  GeosLibrary* lib() const { return lib_; }
  GEOSKIT_Handle handle() const { return handle_; }

  // Every error and notice GEOS reported on this session, oldest first.
  // The log only grows.
  const std::vector<std::string>& messages() const { return messages_; }
  // The errors and the notices in messages(), each oldest first.
  const std::vector<std::string>& errors() const { return errors_; }
  const std::vector<std::string>& notices() const { return notices_; }

  // LibraryError returns a LibraryError status carrying messages()[first:].
  // If that is empty, the message says that GEOS failed without reporting
  // why.
  Status LibraryError(size_t first = 0) const;

 private:
  Context(GeosLibrary* lib, GEOSKIT_Handle handle);
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  static void ErrorHandler(const char* msg, void* userdata);
  static void NoticeHandler(const char* msg, void* userdata);

  GeosLibrary* const lib_;
  const GEOSKIT_Handle handle_;
  std::vector<std::string> messages_;
  std::vector<std::string> errors_;
  std::vector<std::string> notices_;
};

}  // namespace geoskit
