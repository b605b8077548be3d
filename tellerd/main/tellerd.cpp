/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gflags/gflags.h>

#include <cstdlib>
#include <iostream>

#include "common/result.hpp"
#include "logger/logger.hpp"
#include "logger/logger_manager.hpp"
#include "main/application.hpp"
#include "main/teller_conf_literals.hpp"
#include "main/teller_conf_loader.hpp"

static const std::string kLogSettingsFromConfigFile = "config_file";

/**
 * Creating input argument for the configuration file location.
 */
DEFINE_string(config, "", "Specify teller configuration file.");

/**
 * Overrides of the table locations from the configuration file.
 */
DEFINE_string(accounts_path, "", "Specify the accounts table file");
DEFINE_string(transactions_path, "", "Specify the transactions log file");

static bool validateVerbosity(const char *flagname, const std::string &val) {
  if (val == kLogSettingsFromConfigFile) {
    return true;
  }
  const auto it = config_members::LogLevels.find(val);
  if (it == config_members::LogLevels.end()) {
    std::cerr << "Invalid value for " << flagname << ": should be one of '"
              << kLogSettingsFromConfigFile;
    for (const auto &level : config_members::LogLevels) {
      std::cerr << "', '" << level.first;
    }
    std::cerr << "'." << std::endl;
    return false;
  }
  return true;
}

/// Verbosity flag for spdlog configuration
DEFINE_string(verbosity, kLogSettingsFromConfigFile, "Log verbosity");
DEFINE_validator(verbosity, &validateVerbosity);

logger::LoggerManagerTreePtr getDefaultLogManager() {
  return std::make_shared<logger::LoggerManagerTree>(logger::LoggerConfig{
      logger::kDefaultLogLevel, logger::getDefaultLogPatterns()});
}

int main(int argc, char *argv[]) {
  gflags::SetUsageMessage("Teller machine terminal over flat file tables");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  logger::LoggerManagerTreePtr log_manager = getDefaultLogManager();
  logger::LoggerPtr log = log_manager->getChild("Init")->getLogger();

  // If the global log level override was set in the command line arguments,
  // create a logger manager with the given log level for all subsystems:
  if (FLAGS_verbosity != kLogSettingsFromConfigFile) {
    logger::LoggerConfig cfg{config_members::LogLevels.at(FLAGS_verbosity),
                             logger::getDefaultLogPatterns()};
    log_manager = std::make_shared<logger::LoggerManagerTree>(std::move(cfg));
    log = log_manager->getChild("Init")->getLogger();
  }

  auto config_result = parse_teller_config(FLAGS_config, {log});
  if (auto e = teller::expected::resultToOptionalError(config_result)) {
    log->critical("Failed reading the configuration: {}", e.value());
    return EXIT_FAILURE;
  }
  auto config = std::move(config_result).assumeValue();

  if (FLAGS_verbosity == kLogSettingsFromConfigFile and config.logger_manager) {
    log_manager = config.logger_manager;
    log = log_manager->getChild("Init")->getLogger();
  }
  if (not FLAGS_accounts_path.empty()) {
    config.accounts_path = FLAGS_accounts_path;
  }
  if (not FLAGS_transactions_path.empty()) {
    config.transactions_path = FLAGS_transactions_path;
  }
  log->info("config initialized");

  Application application(std::move(config), log_manager);
  if (auto e = teller::expected::resultToOptionalError(application.init())) {
    log->critical("Failed to initialize teller: {}", e.value());
    std::cerr << "Failed to initialize storage: " << e.value() << std::endl;
    return EXIT_FAILURE;
  }

  application.run(std::cin, std::cout);

  gflags::ShutDownCommandLineFlags();
  return EXIT_SUCCESS;
}
