// Copyright 2020 The Cockroach Authors.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "testutils.h"
#include <fmt/format.h>
#include <regex>
#include <string.h>

namespace testutils {

geoskit::GeosLibrary* LoadGeos(std::string* why) {
  geoskit::GeosLibrary* lib = nullptr;
  auto status = geoskit::DefaultGeosLibrary(&lib);
  if (!status.ok()) {
    *why = status.ToString();
    return nullptr;
  }
  return lib;
}

geoskit::Status compareErrorMessage(geoskit::Status status, const char* err_msg, bool partial) {
  if (strcmp("", err_msg) == 0) {
    // Expected success.
    if (status.ok()) {
      return geoskit::Status::OK();
    }
    return geoskit::Status::InvalidArgument(
        fmt::format("expected success, got error \"{}\"", status.ToString()));
  }

  // Expected failure.
  if (status.ok()) {
    return geoskit::Status::InvalidArgument(
        fmt::format("expected error \"{}\", got success", err_msg));
  }
  std::regex re(err_msg);
  if (partial) {
    // Partial regexp match.
    std::cmatch cm;
    if (std::regex_search(status.message().c_str(), cm, re)) {
      return geoskit::Status::OK();
    }
  } else {
    // Full regexp match.
    if (std::regex_match(status.message(), re)) {
      return geoskit::Status::OK();
    }
  }

  return geoskit::Status::InvalidArgument(
      fmt::format("expected error \"{}\", got \"{}\"", err_msg, status.message()));
}

geoskit::Status compareErrorMessage(geoskit::Status status, std::string err_msg, bool partial) {
  return compareErrorMessage(status, err_msg.c_str(), partial);
}

}  // namespace testutils
