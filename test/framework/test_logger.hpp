/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_TEST_FRAMEWORK_TEST_LOGGER_HPP
#define TELLER_TEST_FRAMEWORK_TEST_LOGGER_HPP

#include "logger/logger.hpp"
#include "logger/logger_manager_fwd.hpp"

/// The root of the loggers used in tests
logger::LoggerManagerTreePtr getTestLoggerManager(
    const logger::LogLevel &log_level = logger::LogLevel::kDebug);

logger::LoggerPtr getTestLogger(const std::string &tag);

#endif  // TELLER_TEST_FRAMEWORK_TEST_LOGGER_HPP
