// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace cdgw::utils {

/**
 * @brief Verbosity levels understood by the CDGW logger
 *
 * These map one-to-one onto the spdlog levels, but keep spdlog out of the
 * public signatures of code that only wants to adjust verbosity.
 */
enum class LogLevel { trace, debug, info, warn, error, critical, off };

/**
 * @brief Access point for the library-wide spdlog logger
 *
 * All CDGW components write through a single named logger ("cdgw") so that
 * applications can redirect or silence the library in one place, e.g.
 *
 * @code
 * cdgw::utils::Logger::set_global_level(cdgw::utils::LogLevel::warn);
 * @endcode
 *
 * The logger is created lazily on first use with a colored stdout sink.
 */
class Logger {
 public:
  /**
   * @brief Get the shared CDGW logger, creating it on first use
   * @return Shared pointer to the spdlog logger named "cdgw"
   */
  static std::shared_ptr<spdlog::logger> get();

  /**
   * @brief Set the verbosity of the CDGW logger
   * @param level New level
   */
  static void set_global_level(LogLevel level);

  /**
   * @brief Current verbosity of the CDGW logger
   */
  static LogLevel get_global_level();

  /**
   * @brief Emit a trace record for entry into a function
   *
   * Use through CDGW_LOG_TRACE_ENTERING(), which fills in the function name.
   *
   * @param function Name of the function being entered
   */
  static void trace_entering(const char* function);

  /**
   * @brief Convert a CDGW log level to the spdlog equivalent
   */
  static spdlog::level::level_enum to_spdlog_level(LogLevel level);

  /**
   * @brief Convert a spdlog level to the CDGW equivalent
   */
  static LogLevel from_spdlog_level(spdlog::level::level_enum level);
};

/**
 * @brief Lowers the logger threshold for the lifetime of the object
 *
 * Used by algorithms whose `debug` setting asks for verbose intermediate
 * reporting. The previous level is restored on destruction. A guard that is
 * asked for a level less verbose than the current one does nothing.
 */
class ScopedLogLevel {
 public:
  explicit ScopedLogLevel(LogLevel level);
  ~ScopedLogLevel();

  ScopedLogLevel(const ScopedLogLevel&) = delete;
  ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

 private:
  LogLevel previous_;
  bool active_ = false;
};

}  // namespace cdgw::utils

/// Shorthand for the CDGW logger
#define CDGW_LOGGER() (*::cdgw::utils::Logger::get())

/// Trace-level record naming the enclosing function
#define CDGW_LOG_TRACE_ENTERING() \
  ::cdgw::utils::Logger::trace_entering(__func__)
