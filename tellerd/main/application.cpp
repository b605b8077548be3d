/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "main/application.hpp"

#include <ostream>

#include "common/result_try.hpp"
#include "common_objects/amount.hpp"
#include "cryptography/pin_hasher.hpp"
#include "logger/logger.hpp"
#include "logger/logger_manager.hpp"
#include "service/impl/account_service_impl.hpp"
#include "shell/teller_shell.hpp"
#include "storage/impl/flat_file_record_store.hpp"

namespace {
  /// Accounts of a fresh installation when the config names none
  struct DemoAccount {
    const char *account_number;
    const char *name;
    const char *pin;
    const char *address;
  };

  const DemoAccount kDemoAccounts[] = {
      {"987654321", "Saqlain Rai", "1234", "123 Main St, Karachi"},
      {"123456789", "Ahmed", "5678", "456 Gulshan Ave, Lahore"},
  };

  const char *kDemoBalance = "0.00";
}  // namespace

Application::Application(TellerConfig config,
                         logger::LoggerManagerTreePtr log_manager)
    : config_(std::move(config)),
      log_manager_(std::move(log_manager)),
      log_(log_manager_->getChild("Application")->getLogger()) {}

Application::RunResult Application::init() {
  TELLER_EXPECTED_ERROR_CHECK(initStorage());
  TELLER_EXPECTED_ERROR_CHECK(initAccountService());
  return {};
}

Application::RunResult Application::initStorage() {
  auto store_result = teller::storage::FlatFileRecordStore::create(
      config_.accounts_path,
      config_.transactions_path,
      log_manager_->getChild("RecordStore")->getLogger());
  if (auto e = teller::expected::resultToOptionalError(store_result)) {
    log_->critical("Failed to open storage: {}", e.value());
    return e.value();
  }
  store_ = std::move(store_result).assumeValue();

  auto created = store_->initialize();
  if (auto e = teller::expected::resultToOptionalError(created)) {
    log_->critical("Failed to initialize storage: {}", e->toString());
    return e->toString();
  }
  if (created.assumeValue()) {
    log_->info("created accounts table {}", config_.accounts_path);
    TELLER_EXPECTED_ERROR_CHECK(seedAccounts());
  }
  log_->info("storage initialized");
  return {};
}

Application::RunResult Application::initAccountService() {
  service_ = std::make_shared<teller::service::AccountServiceImpl>(
      store_, log_manager_->getChild("AccountService")->getLogger());
  log_->info("account service initialized");
  return {};
}

Application::RunResult Application::seedAccounts() {
  TELLER_EXPECTED_TRY_GET_VALUE(accounts, makeSeedAccounts());
  if (auto e = teller::expected::resultToOptionalError(
          store_->saveAccounts(accounts))) {
    log_->critical("Failed to seed accounts: {}", e->toString());
    return e->toString();
  }
  log_->info("seeded {} accounts", accounts.size());
  return {};
}

teller::expected::Result<std::vector<teller::model::Account>, std::string>
Application::makeSeedAccounts() const {
  std::vector<teller::model::Account> accounts;
  if (config_.seed_accounts) {
    for (const auto &seed : *config_.seed_accounts) {
      accounts.emplace_back(
          seed.account_number,
          seed.name,
          seed.pin_hash,
          seed.address,
          teller::model::Amount{seed.balance}.rescaled(
              teller::model::kMoneyPrecision),
          false);
    }
    return accounts;
  }

  teller::crypto::PinHasher hasher;
  for (const auto &demo : kDemoAccounts) {
    TELLER_EXPECTED_TRY_GET_VALUE(pin_hash, hasher.hash(demo.pin));
    accounts.emplace_back(demo.account_number,
                          demo.name,
                          std::move(pin_hash),
                          demo.address,
                          teller::model::Amount{kDemoBalance},
                          false);
  }
  return accounts;
}

void Application::run(std::istream &in, std::ostream &out) {
  if (not service_) {
    log_->error("run() called before a successful init()");
    return;
  }
  teller::shell::TellerShell shell(service_,
                                   config_.max_pin_attempts,
                                   in,
                                   out,
                                   log_manager_->getChild("Shell")->getLogger());
  shell.run();
}

std::shared_ptr<teller::storage::RecordStore> Application::recordStore()
    const {
  return store_;
}

std::shared_ptr<teller::service::AccountService> Application::accountService()
    const {
  return service_;
}
