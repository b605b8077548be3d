/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_CONF_LITERALS_HPP
#define TELLER_CONF_LITERALS_HPP

#include <string>
#include <unordered_map>

#include "logger/logger.hpp"

namespace config_members {
  extern const char *AccountsPath;
  extern const char *TransactionsPath;
  extern const char *MaxPinAttempts;
  extern const char *SeedAccounts;
  extern const char *AccountNumber;
  extern const char *Name;
  extern const char *PinHash;
  extern const char *Address;
  extern const char *Balance;
  extern const char *LogSection;
  extern const char *LogLevel;
  extern const char *LogPatternsSection;
  extern const char *LogChildrenSection;
  extern const std::unordered_map<std::string, logger::LogLevel> LogLevels;
}  // namespace config_members

#endif  // TELLER_CONF_LITERALS_HPP
