/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_APPLICATION_HPP
#define TELLER_APPLICATION_HPP

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "common/result.hpp"
#include "common_objects/account.hpp"
#include "logger/logger_fwd.hpp"
#include "logger/logger_manager_fwd.hpp"
#include "main/teller_conf_loader.hpp"

namespace teller {
  namespace storage {
    class RecordStore;
  }
  namespace service {
    class AccountService;
  }
}  // namespace teller

class Application {
 public:
  using RunResult = teller::expected::Result<void, std::string>;

  /**
   * @param config - loaded configuration, paths already overridden by flags
   * @param log_manager - root of the logger tree
   */
  Application(TellerConfig config, logger::LoggerManagerTreePtr log_manager);

  /**
   * Open the tables, creating them if they do not exist, and seed the
   * accounts table when it has just been created.
   * @return error message when the storage is unusable
   */
  RunResult init();

  /**
   * Serve one terminal session on the given streams. Requires a
   * successful init().
   */
  void run(std::istream &in, std::ostream &out);

  std::shared_ptr<teller::storage::RecordStore> recordStore() const;

  std::shared_ptr<teller::service::AccountService> accountService() const;

 private:
  RunResult initStorage();

  RunResult initAccountService();

  /// Write the configured or the demonstration accounts.
  RunResult seedAccounts();

  teller::expected::Result<std::vector<teller::model::Account>, std::string>
  makeSeedAccounts() const;

  TellerConfig config_;
  logger::LoggerManagerTreePtr log_manager_;
  logger::LoggerPtr log_;

  std::shared_ptr<teller::storage::RecordStore> store_;
  std::shared_ptr<teller::service::AccountService> service_;
};

#endif  // TELLER_APPLICATION_HPP
