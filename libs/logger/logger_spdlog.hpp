/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_LOGGER_LOGGER_SPDLOG_HPP
#define TELLER_LOGGER_LOGGER_SPDLOG_HPP

#include "logger/logger.hpp"

#include <map>
#include <memory>
#include <string>

namespace spdlog {
  class logger;
}

namespace logger {

  /// Patterns for logging depending on the log level.
  class LogPatterns {
   public:
    /// Set a logging pattern for the given level.
    void setPattern(LogLevel level, std::string pattern);

    /**
     * Get the logging pattern for the given level. If not set, get the
     * next present more verbose level pattern, if any, or the default
     * pattern.
     */
    std::string getPattern(LogLevel level) const;

   private:
    std::map<LogLevel, std::string> patterns_;
  };

  /// Default log patterns.
  LogPatterns getDefaultLogPatterns();

  /// Logger configuration.
  struct LoggerConfig {
    LogLevel log_level;
    LogPatterns patterns;
  };

  using ConstLoggerConfigPtr = std::shared_ptr<const LoggerConfig>;

  /// Logger that writes to stderr through spdlog.
  class LoggerSpdlog : public Logger {
   public:
    /**
     * @param tag - the tagged name shown in log lines
     * @param config - logger configuration
     */
    LoggerSpdlog(std::string tag, ConstLoggerConfigPtr config);

   private:
    void logInternal(Level level, const std::string &s) const override;

    bool shouldLog(Level level) const override;

    const std::string tag_;
    const ConstLoggerConfigPtr config_;
    const std::shared_ptr<spdlog::logger> logger_;
  };

}  // namespace logger

#endif  // TELLER_LOGGER_LOGGER_SPDLOG_HPP
