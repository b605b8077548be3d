/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "main/teller_conf_literals.hpp"

namespace config_members {
  const char *AccountsPath = "accounts_path";
  const char *TransactionsPath = "transactions_path";
  const char *MaxPinAttempts = "max_pin_attempts";
  const char *SeedAccounts = "seed_accounts";
  const char *AccountNumber = "account_number";
  const char *Name = "name";
  const char *PinHash = "pin_hash";
  const char *Address = "address";
  const char *Balance = "balance";
  const char *LogSection = "log";
  const char *LogLevel = "level";
  const char *LogPatternsSection = "patterns";
  const char *LogChildrenSection = "children";
  const std::unordered_map<std::string, logger::LogLevel> LogLevels{
      {"trace", logger::LogLevel::kTrace},
      {"debug", logger::LogLevel::kDebug},
      {"info", logger::LogLevel::kInfo},
      {"warning", logger::LogLevel::kWarn},
      {"error", logger::LogLevel::kError},
      {"critical", logger::LogLevel::kCritical}};
}  // namespace config_members
