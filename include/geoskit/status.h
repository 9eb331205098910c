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

#include <string>

namespace geoskit {

// A Status reports the outcome of an operation. Every public entry point in
// geoskit returns a Status; results are written through output parameters
// only when the returned Status is ok().
class Status {
 public:
  enum Code {
    kOk = 0,
    // The GEOS shared libraries or one of their symbols could not be loaded.
    kLoadError = 1,
    // GEOS failed to initialize a session handle.
    kEngineInit = 2,
    // GEOS signalled a failure. The message carries the errors GEOS reported
    // on the session that made the call.
    kLibraryError = 3,
    // GEOS succeeded but the result has fewer coordinates than the decoded
    // shape requires.
    kTooFewPoints = 4,
    kTypeMismatch = 5,
    kUnsupportedType = 6,
    kNoMinimumBoundingCircle = 7,
    kUnexpectedResult = 8,
    kInvalidArgument = 9,
  };

  Status() : code_(kOk) {}

  static Status OK() { return Status(); }
  static Status LoadError(const std::string& msg) { return Status(kLoadError, msg); }
  static Status EngineInit(const std::string& msg) { return Status(kEngineInit, msg); }
  static Status LibraryError(const std::string& msg) { return Status(kLibraryError, msg); }
  static Status TooFewPoints(const std::string& msg) { return Status(kTooFewPoints, msg); }
  static Status TypeMismatch(const std::string& msg) { return Status(kTypeMismatch, msg); }
  static Status UnsupportedType(const std::string& msg) { return Status(kUnsupportedType, msg); }
  static Status NoMinimumBoundingCircle() {
    return Status(kNoMinimumBoundingCircle, "geos returned a radius without a center");
  }
  static Status UnexpectedResult(const std::string& msg) {
    return Status(kUnexpectedResult, msg);
  }
  static Status InvalidArgument(const std::string& msg) {
    return Status(kInvalidArgument, msg);
  }

  bool ok() const { return code_ == kOk; }
  Code code() const { return code_; }
  const std::string& message() const { return message_; }

  bool IsLoadError() const { return code_ == kLoadError; }
  bool IsEngineInit() const { return code_ == kEngineInit; }
  bool IsLibraryError() const { return code_ == kLibraryError; }
  bool IsTooFewPoints() const { return code_ == kTooFewPoints; }
  bool IsTypeMismatch() const { return code_ == kTypeMismatch; }
  bool IsUnsupportedType() const { return code_ == kUnsupportedType; }
  bool IsNoMinimumBoundingCircle() const { return code_ == kNoMinimumBoundingCircle; }
  bool IsUnexpectedResult() const { return code_ == kUnexpectedResult; }
  bool IsInvalidArgument() const { return code_ == kInvalidArgument; }

  // Returns a string of the form "<code name>: <message>", or "OK".
  std::string ToString() const;

 private:
  Status(Code code, const std::string& msg) : code_(code), message_(msg) {}

  Code code_;
  std::string message_;
};

}  // namespace geoskit
