// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cdgw/utils/logger.hpp>
#include <mutex>

namespace cdgw::utils {

namespace {
constexpr const char* logger_name = "cdgw";
}

std::shared_ptr<spdlog::logger> Logger::get() {
  static std::once_flag init_flag;
  static std::shared_ptr<spdlog::logger> logger;
  std::call_once(init_flag, []() {
    // An application may have registered its own "cdgw" logger already
    logger = spdlog::get(logger_name);
    if (!logger) {
      logger = spdlog::stdout_color_mt(logger_name);
      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
      logger->set_level(spdlog::level::info);
    }
  });
  return logger;
}

void Logger::set_global_level(LogLevel level) {
  get()->set_level(to_spdlog_level(level));
}

LogLevel Logger::get_global_level() {
  return from_spdlog_level(get()->level());
}

void Logger::trace_entering(const char* function) {
  auto logger = get();
  if (logger->should_log(spdlog::level::trace)) {
    logger->trace("Entering {}", function);
  }
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
  switch (level) {
    case LogLevel::trace:
      return spdlog::level::trace;
    case LogLevel::debug:
      return spdlog::level::debug;
    case LogLevel::info:
      return spdlog::level::info;
    case LogLevel::warn:
      return spdlog::level::warn;
    case LogLevel::error:
      return spdlog::level::err;
    case LogLevel::critical:
      return spdlog::level::critical;
    case LogLevel::off:
      return spdlog::level::off;
  }
  return spdlog::level::info;
}

LogLevel Logger::from_spdlog_level(spdlog::level::level_enum level) {
  switch (level) {
    case spdlog::level::trace:
      return LogLevel::trace;
    case spdlog::level::debug:
      return LogLevel::debug;
    case spdlog::level::info:
      return LogLevel::info;
    case spdlog::level::warn:
      return LogLevel::warn;
    case spdlog::level::err:
      return LogLevel::error;
    case spdlog::level::critical:
      return LogLevel::critical;
    default:
      return LogLevel::off;
  }
}

ScopedLogLevel::ScopedLogLevel(LogLevel level)
    : previous_(Logger::get_global_level()) {
  // LogLevel is ordered from most to least verbose
  if (static_cast<int>(level) < static_cast<int>(previous_)) {
    Logger::set_global_level(level);
    active_ = true;
  }
}

ScopedLogLevel::~ScopedLogLevel() {
  if (active_) {
    Logger::set_global_level(previous_);
  }
}

}  // namespace cdgw::utils
