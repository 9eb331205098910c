// Copyright 2020 The Cockroach Authors.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "include/geoskit/status.h"

namespace geoskit {

namespace {

const char* CodeName(Status::Code code) {
  switch (code) {
    case Status::kOk:
      return "OK";
    case Status::kLoadError:
      return "load error";
    case Status::kEngineInit:
      return "engine init error";
    case Status::kLibraryError:
      return "library error";
    case Status::kTooFewPoints:
      return "too few points";
    case Status::kTypeMismatch:
      return "type mismatch";
    case Status::kUnsupportedType:
      return "unsupported type";
    case Status::kNoMinimumBoundingCircle:
      return "no minimum bounding circle";
    case Status::kUnexpectedResult:
      return "unexpected result";
    case Status::kInvalidArgument:
      return "invalid argument";
  }
  return "unknown";
}

}  // namespace

std::string Status::ToString() const {
  if (ok()) {
    return "OK";
  }
  std::string result(CodeName(code_));
  if (!message_.empty()) {
    result.append(": ");
    result.append(message_);
  }
  return result;
}

}  // namespace geoskit
