// Copyright 2020 The Cockroach Authors.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include "include/geoskit/logging.h"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdlib.h>

namespace geoskit {

namespace {

const char kLoggerName[] = "geoskit";

std::mutex logger_mu;
std::shared_ptr<spdlog::logger> logger;

spdlog::level::level_enum LevelFromEnv() {
  const char* level = getenv("GEOSKIT_LOG_LEVEL");
  if (level == nullptr || *level == '\0') {
    return spdlog::level::warn;
  }
  return spdlog::level::from_str(level);
}

std::shared_ptr<spdlog::logger> NewDefaultLogger() {
  auto existing = spdlog::get(kLoggerName);
  if (existing != nullptr) {
    return existing;
  }
  auto l = spdlog::stderr_color_mt(kLoggerName);
  l->set_level(LevelFromEnv());
  return l;
}

}  // namespace

std::shared_ptr<spdlog::logger> Logger() {
  std::lock_guard<std::mutex> guard(logger_mu);
  if (logger == nullptr) {
    logger = NewDefaultLogger();
  }
  return logger;
}

void SetLogger(std::shared_ptr<spdlog::logger> l) {
  std::lock_guard<std::mutex> guard(logger_mu);
  logger = std::move(l);
}

}  // namespace geoskit
