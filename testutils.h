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

#include <gtest/gtest.h>
#include <string>
#include "include/geoskit/library.h"
#include "include/geoskit/status.h"

namespace testutils {

// LoadGeos loads the system GEOS library. Returns nullptr, after recording
// why, if GEOS is not installed.
geoskit::GeosLibrary* LoadGeos(std::string* why);

geoskit::Status compareErrorMessage(geoskit::Status status, const char* err_msg, bool partial);
geoskit::Status compareErrorMessage(geoskit::Status status, std::string err_msg, bool partial);

}  // namespace testutils

// clang-format isn't so great for macros.
// clang-format off

#define EXPECT_OK(status)\
  {\
    auto _status(status);\
    EXPECT_TRUE(_status.ok()) << "got: " << _status.ToString();\
  }
#define ASSERT_OK(status)\
  {\
    auto _status(status);\
    ASSERT_TRUE(_status.ok()) << "got: " << _status.ToString();\
  }

// If err_msg is empty, status must be ok. Otherwise, the status message must match
// 'err_msg' (regexp full match).
#define EXPECT_ERR(status, err_msg)\
  {\
    auto _status(testutils::compareErrorMessage(status, err_msg, false)); \
    EXPECT_TRUE(_status.ok()) << _status.ToString();\
  }

// If err_msg is empty, status must be ok. Otherwise, the status message must match
// 'err_msg' (regexp partial match).
#define EXPECT_PARTIAL_ERR(status, err_msg)\
  {\
    auto _status(testutils::compareErrorMessage(status, err_msg, true)); \
    EXPECT_TRUE(_status.ok()) << _status.ToString();\
  }

// Skips the current test when GEOS is not installed.
#define GEOSKIT_REQUIRE_GEOS(lib)\
  geoskit::GeosLibrary* lib = nullptr;\
  {\
    std::string why;\
    lib = testutils::LoadGeos(&why);\
    if (lib == nullptr) {\
      GTEST_SKIP() << "GEOS not available: " << why;\
    }\
  }

// clang-format on
