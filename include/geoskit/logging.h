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
#include <spdlog/spdlog.h>

namespace geoskit {

// Logger returns the logger geoskit writes to. Unless SetLogger was called,
// this is a logger named "geoskit" writing to stderr, created on first use
// with the level named by the GEOSKIT_LOG_LEVEL environment variable
// ("trace", "debug", "info", "warn", "error", "critical" or "off"; "warn" if
// unset).
std::shared_ptr<spdlog::logger> Logger();

// SetLogger routes geoskit's logging to logger. Passing nullptr restores the
// default logger.
void SetLogger(std::shared_ptr<spdlog::logger> logger);

}  // namespace geoskit
