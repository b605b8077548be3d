/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>
#include "logger/logger_manager.hpp"

TEST(LoggerTest, basicStandaloneLoggerTest) {
  logger::LoggerConfig config{logger::LogLevel::kInfo,
                              logger::getDefaultLogPatterns()};
  logger::LoggerManagerTree manager(
      std::make_shared<const logger::LoggerConfig>(std::move(config)));
  auto a_logger = manager.getChild("test info logger")->getLogger();
  a_logger->trace("testing a standalone logger: trace");
  a_logger->info("testing a standalone logger: info");
  a_logger->error("testing a standalone logger: error");
}

TEST(LoggerTest, boolReprTest) {
  ASSERT_EQ("yes", logger::boolRepr(true));
  ASSERT_EQ("no", logger::boolRepr(false));
}

/**
 * @given a logger tree with a registered child
 * @when the child and an unregistered grandchild are requested twice
 * @then the same nodes are returned
 */
TEST(LoggerTest, childrenAreCached) {
  logger::LoggerManagerTree manager(logger::LoggerConfig{
      logger::LogLevel::kWarn, logger::getDefaultLogPatterns()});
  auto child =
      manager.registerChild("Storage", logger::LogLevel::kDebug, boost::none);
  EXPECT_EQ(child, manager.getChild("Storage"));
  EXPECT_EQ(child->getChild("Csv"), manager.getChild("Storage")->getChild("Csv"));
  EXPECT_EQ(child->getLogger(), manager.getChild("Storage")->getLogger());
}

/**
 * @given log patterns with a pattern for the info level only
 * @when patterns for more and less verbose levels are requested
 * @then a level falls back to the nearest more verbose set pattern, or to
 * the default one
 */
TEST(LoggerTest, patternsFallBack) {
  logger::LogPatterns patterns;
  patterns.setPattern(logger::LogLevel::kInfo, "info: %v");
  EXPECT_EQ(patterns.getPattern(logger::LogLevel::kError), "info: %v");
  EXPECT_EQ(patterns.getPattern(logger::LogLevel::kInfo), "info: %v");
  EXPECT_NE(patterns.getPattern(logger::LogLevel::kTrace), "info: %v");
}
