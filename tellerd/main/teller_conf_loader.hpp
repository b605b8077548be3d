/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_CONF_LOADER_HPP
#define TELLER_CONF_LOADER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/result_fwd.hpp"
#include "logger/logger_fwd.hpp"
#include "logger/logger_manager.hpp"

static const std::string kDefaultAccountsPath = "users.csv";
static const std::string kDefaultTransactionsPath = "transactions.csv";

struct TellerConfig {
  /// An account written to a freshly created accounts table
  struct SeedAccount {
    std::string account_number;
    std::string name;
    std::string pin_hash;
    std::string address;
    std::string balance;
  };

  std::string accounts_path = kDefaultAccountsPath;
  std::string transactions_path = kDefaultTransactionsPath;
  uint32_t max_pin_attempts = 3;
  /// Unset means the built-in demonstration accounts
  std::optional<std::vector<SeedAccount>> seed_accounts;
  logger::LoggerManagerTreePtr logger_manager;
};

/**
 * Parse the teller configuration file. Every member is optional, the
 * missing ones keep the TellerConfig defaults.
 * @param conf_path - path to the JSON config, empty for the defaults only
 * @param log - logger for the loading process
 * @return the config or the error message naming the offending key
 */
teller::expected::Result<TellerConfig, std::string> parse_teller_config(
    const std::string &conf_path, std::optional<logger::LoggerPtr> log);

/// Same as parse_teller_config, for an already read JSON text.
teller::expected::Result<TellerConfig, std::string> parse_teller_config_text(
    const std::string &config_text, std::optional<logger::LoggerPtr> log);

#endif  // TELLER_CONF_LOADER_HPP
