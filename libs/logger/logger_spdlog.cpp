/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger_spdlog.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

  const std::string kDefaultPattern =
      R"([%Y-%m-%d %H:%M:%S.%F] [%n] [%^%l%$] %v)";

  spdlog::level::level_enum getSpdlogLogLevel(logger::LogLevel level) {
    switch (level) {
      case logger::LogLevel::kTrace:
        return spdlog::level::trace;
      case logger::LogLevel::kDebug:
        return spdlog::level::debug;
      case logger::LogLevel::kInfo:
        return spdlog::level::info;
      case logger::LogLevel::kWarn:
        return spdlog::level::warn;
      case logger::LogLevel::kError:
        return spdlog::level::err;
      case logger::LogLevel::kCritical:
        return spdlog::level::critical;
    }
    return spdlog::level::off;
  }

  /// The stderr sink is shared by every logger of the process.
  std::shared_ptr<spdlog::sinks::sink> getSharedSink() {
    static auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    return sink;
  }

  std::shared_ptr<spdlog::logger> makeSpdlogLogger(
      const std::string &tag, const logger::LoggerConfig &config) {
    auto logger = std::make_shared<spdlog::logger>(tag, getSharedSink());
    logger->set_level(getSpdlogLogLevel(config.log_level));
    logger->set_pattern(config.patterns.getPattern(config.log_level));
    return logger;
  }

}  // namespace

namespace logger {

  void LogPatterns::setPattern(LogLevel level, std::string pattern) {
    patterns_[level] = std::move(pattern);
  }

  std::string LogPatterns::getPattern(LogLevel level) const {
    for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
      if (it->first <= level) {
        return it->second;
      }
    }
    return kDefaultPattern;
  }

  LogPatterns getDefaultLogPatterns() {
    LogPatterns patterns;
    patterns.setPattern(LogLevel::kTrace, kDefaultPattern);
    return patterns;
  }

  LoggerSpdlog::LoggerSpdlog(std::string tag, ConstLoggerConfigPtr config)
      : tag_(std::move(tag)),
        config_(std::move(config)),
        logger_(makeSpdlogLogger(tag_, *config_)) {}

  void LoggerSpdlog::logInternal(Level level, const std::string &s) const {
    logger_->log(getSpdlogLogLevel(level), s);
  }

  bool LoggerSpdlog::shouldLog(Level level) const {
    return config_->log_level <= level;
  }

}  // namespace logger
