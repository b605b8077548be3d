/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "service/impl/account_service_impl.hpp"

#include <algorithm>
#include <ctime>

#include <fmt/chrono.h>
#include <fmt/core.h>
#include "common/result_try.hpp"
#include "logger/logger.hpp"

using namespace teller::service;
using teller::model::Account;
using teller::model::Amount;
using teller::model::TransactionDirection;
using teller::model::TransactionRecord;
using teller::model::TransactionType;

namespace {
  template <typename T>
  using ServiceResult = teller::expected::Result<T, ServiceError>;

  template <typename T>
  ServiceResult<T> fromStorage(teller::storage::StorageResult<T> result) {
    return std::move(result).match(
        [](auto &&value) -> ServiceResult<T> { return std::move(value); },
        [](auto &&error) -> ServiceResult<T> {
          return teller::expected::makeError(
              ServiceError::fromStorage(error.error));
        });
  }

  auto isActive(const std::string &account_number) {
    return [&account_number](const Account &account) {
      return not account.isDeleted()
          and account.accountNumber() == account_number;
    };
  }
}  // namespace

teller::model::types::TimestampType teller::service::currentLocalTime() {
  return fmt::format("{:%Y-%m-%d %H:%M:%S}",
                     fmt::localtime(std::time(nullptr)));
}

AccountServiceImpl::AccountServiceImpl(
    std::shared_ptr<storage::RecordStore> store,
    logger::LoggerPtr log,
    TimeFunction time_provider)
    : store_(std::move(store)),
      time_provider_(std::move(time_provider)),
      log_(std::move(log)) {}

ServiceResult<Account> AccountServiceImpl::authenticate(
    const std::string &account_number, const std::string &pin) {
  if (auto error = field_validator_.validatePin(pin)) {
    log_->info("login to {} rejected: malformed PIN", account_number);
    return expected::makeError(ServiceError::fromValidation(*error));
  }

  TELLER_EXPECTED_TRY_GET_VALUE(accounts,
                                fromStorage(store_->loadAccounts()));
  auto it =
      std::find_if(accounts.begin(), accounts.end(), isActive(account_number));
  if (it == accounts.end()) {
    log_->info("login to {} rejected: no such active account",
               account_number);
    return expected::makeError(ServiceError::auth(
        ServiceError::Reason::kNotFound, "Account not found."));
  }

  TELLER_EXPECTED_TRY_GET_VALUE(pin_hash, hashPin(pin));
  if (it->pinHash() != pin_hash) {
    log_->info("login to {} rejected: wrong PIN", account_number);
    return expected::makeError(
        ServiceError::auth(ServiceError::Reason::kBadPin, "Incorrect PIN."));
  }

  log_->info("{} logged in", account_number);
  return expected::makeValue(*it);
}

ServiceResult<Amount> AccountServiceImpl::checkBalance(
    const Account &account) const {
  return expected::makeValue(account.balance());
}

ServiceResult<Account> AccountServiceImpl::deposit(const Account &account,
                                                   const std::string &amount) {
  TELLER_EXPECTED_TRY_GET_VALUE(value, parseAmount(amount));
  TELLER_EXPECTED_TRY_GET_VALUE(snapshot, loadSession(account));

  auto updated = snapshot.accounts;
  auto &row = updated[snapshot.session_index];
  auto balance = row.balance();
  balance += value;
  row.setBalance(std::move(balance));

  TELLER_EXPECTED_ERROR_CHECK(
      commit(snapshot.accounts,
             updated,
             {TransactionRecord(time_provider_(),
                                row.accountNumber(),
                                TransactionType::kDeposit,
                                value,
                                std::nullopt,
                                TransactionDirection::kCredit)}));
  log_->info("deposited {} to {}", value.toStringRepr(), row.accountNumber());
  return expected::makeValue(row);
}

ServiceResult<Account> AccountServiceImpl::withdraw(
    const Account &account, const std::string &amount) {
  TELLER_EXPECTED_TRY_GET_VALUE(value, parseAmount(amount));
  TELLER_EXPECTED_TRY_GET_VALUE(snapshot, loadSession(account));

  auto updated = snapshot.accounts;
  auto &row = updated[snapshot.session_index];
  if (row.balance() < value) {
    log_->info("withdrawal of {} from {} rejected: balance is {}",
               value.toStringRepr(),
               row.accountNumber(),
               row.balance().toStringRepr());
    return expected::makeError(ServiceError::insufficientFunds(
        fmt::format("Insufficient funds. Current balance: {}",
                    row.balance().toStringRepr())));
  }
  auto balance = row.balance();
  balance -= value;
  row.setBalance(std::move(balance));

  TELLER_EXPECTED_ERROR_CHECK(
      commit(snapshot.accounts,
             updated,
             {TransactionRecord(time_provider_(),
                                row.accountNumber(),
                                TransactionType::kWithdrawal,
                                value,
                                std::nullopt,
                                TransactionDirection::kDebit)}));
  log_->info("withdrew {} from {}", value.toStringRepr(), row.accountNumber());
  return expected::makeValue(row);
}

ServiceResult<TransferOutcome> AccountServiceImpl::transfer(
    const Account &account,
    const std::string &target_account_number,
    const std::string &amount) {
  if (target_account_number == account.accountNumber()) {
    return expected::makeError(ServiceError::fromValidation(
        validation::ValidationError("TargetAccount",
                                    validation::ValidationReason::kSelfTransfer,
                                    {"Cannot transfer to the same account."})));
  }

  TELLER_EXPECTED_TRY_GET_VALUE(snapshot, loadSession(account));
  auto updated = snapshot.accounts;
  auto target_it = std::find_if(
      updated.begin(), updated.end(), isActive(target_account_number));
  if (target_it == updated.end()) {
    log_->info("transfer from {} rejected: no active account {}",
               account.accountNumber(),
               target_account_number);
    return expected::makeError(ServiceError::accountNotFound(fmt::format(
        "Target account {} not found.", target_account_number)));
  }

  TELLER_EXPECTED_TRY_GET_VALUE(value, parseAmount(amount));
  auto &source = updated[snapshot.session_index];
  auto &target = *target_it;
  if (source.balance() < value) {
    log_->info("transfer of {} from {} rejected: balance is {}",
               value.toStringRepr(),
               source.accountNumber(),
               source.balance().toStringRepr());
    return expected::makeError(ServiceError::insufficientFunds(
        fmt::format("Insufficient funds. Current balance: {}",
                    source.balance().toStringRepr())));
  }

  auto source_balance = source.balance();
  source_balance -= value;
  source.setBalance(std::move(source_balance));
  auto target_balance = target.balance();
  target_balance += value;
  target.setBalance(std::move(target_balance));

  const auto timestamp = time_provider_();
  TELLER_EXPECTED_ERROR_CHECK(
      commit(snapshot.accounts,
             updated,
             {TransactionRecord(timestamp,
                                source.accountNumber(),
                                TransactionType::kTransfer,
                                value,
                                target.accountNumber(),
                                TransactionDirection::kDebit),
              TransactionRecord(timestamp,
                                target.accountNumber(),
                                TransactionType::kTransfer,
                                value,
                                source.accountNumber(),
                                TransactionDirection::kCredit)}));
  log_->info("transferred {} from {} to {}",
             value.toStringRepr(),
             source.accountNumber(),
             target.accountNumber());
  return expected::makeValue(TransferOutcome{source, target});
}

ServiceResult<Account> AccountServiceImpl::changePin(
    const Account &account, const std::string &new_pin) {
  if (auto error = field_validator_.validatePin(new_pin)) {
    return expected::makeError(ServiceError::fromValidation(*error));
  }

  TELLER_EXPECTED_TRY_GET_VALUE(snapshot, loadSession(account));
  TELLER_EXPECTED_TRY_GET_VALUE(pin_hash, hashPin(new_pin));
  for (size_t i = 0; i < snapshot.accounts.size(); ++i) {
    const auto &other = snapshot.accounts[i];
    if (i != snapshot.session_index and not other.isDeleted()
        and other.pinHash() == pin_hash) {
      log_->info("PIN change of {} rejected: PIN is taken",
                 account.accountNumber());
      return expected::makeError(
          ServiceError::fromValidation(validation::ValidationError(
              "Pin",
              validation::ValidationReason::kPinNotUnique,
              {"This PIN is already in use. Please choose a different "
               "PIN."})));
    }
  }

  auto updated = snapshot.accounts;
  auto &row = updated[snapshot.session_index];
  row.setPinHash(std::move(pin_hash));
  TELLER_EXPECTED_ERROR_CHECK(commit(snapshot.accounts, updated, {}));
  log_->info("PIN of {} changed", row.accountNumber());
  return expected::makeValue(row);
}

ServiceResult<Account> AccountServiceImpl::softDelete(const Account &account,
                                                      bool confirmed) {
  if (not confirmed) {
    return expected::makeError(
        ServiceError::fromValidation(validation::ValidationError(
            "Confirmation",
            validation::ValidationReason::kNotConfirmed,
            {"Account deletion was not confirmed."})));
  }

  TELLER_EXPECTED_TRY_GET_VALUE(snapshot, loadSession(account));
  auto updated = snapshot.accounts;
  auto &row = updated[snapshot.session_index];
  row.setDeleted(true);
  TELLER_EXPECTED_ERROR_CHECK(commit(snapshot.accounts, updated, {}));
  log_->info("{} deleted", row.accountNumber());
  return expected::makeValue(row);
}

ServiceResult<std::vector<TransactionRecord>>
AccountServiceImpl::transactionHistory(const Account &account) const {
  return fromStorage(store_->loadTransactions(account.accountNumber()));
}

ServiceResult<AccountServiceImpl::Snapshot> AccountServiceImpl::loadSession(
    const Account &account) const {
  TELLER_EXPECTED_TRY_GET_VALUE(accounts,
                                fromStorage(store_->loadAccounts()));
  auto it = std::find_if(
      accounts.begin(), accounts.end(), isActive(account.accountNumber()));
  if (it == accounts.end()) {
    log_->warn("session account {} is no longer active",
               account.accountNumber());
    return expected::makeError(ServiceError::auth(
        ServiceError::Reason::kNotFound, "Account not found or deleted."));
  }
  const auto index = static_cast<size_t>(it - accounts.begin());
  return expected::makeValue(Snapshot{std::move(accounts), index});
}

ServiceResult<void> AccountServiceImpl::commit(
    const std::vector<Account> &previous,
    const std::vector<Account> &updated,
    const std::vector<TransactionRecord> &records) {
  if (auto e = expected::resultToOptionalError(store_->saveAccounts(updated))) {
    return expected::makeError(ServiceError::fromStorage(*e));
  }

  for (size_t i = 0; i < records.size(); ++i) {
    auto e = expected::resultToOptionalError(
        store_->appendTransaction(records[i]));
    if (not e) {
      continue;
    }
    if (i == 0) {
      log_->error("cannot log {}, restoring the accounts table", records[i]);
      if (auto restore_error = expected::resultToOptionalError(
              store_->saveAccounts(previous))) {
        log_->critical("cannot restore the accounts table: {}",
                       *restore_error);
      }
    } else {
      log_->critical(
          "accounts are updated but {} is missing from the log: {}",
          records[i],
          *e);
    }
    return expected::makeError(ServiceError::fromStorage(*e));
  }
  return expected::makeValue();
}

ServiceResult<Amount> AccountServiceImpl::parseAmount(
    const std::string &amount) const {
  auto parsed = field_validator_.parseAmount(amount);
  if (auto e = expected::resultToOptionalError(parsed)) {
    return expected::makeError(ServiceError::fromValidation(*e));
  }
  return expected::makeValue(std::move(parsed).assumeValue());
}

ServiceResult<teller::model::types::PinHashType> AccountServiceImpl::hashPin(
    const std::string &pin) const {
  auto digest = pin_hasher_.hash(pin);
  if (auto e = expected::resultToOptionalError(digest)) {
    log_->error("cannot compute a PIN digest: {}", *e);
    return expected::makeError(ServiceError::auth(
        ServiceError::Reason::kNone, "PIN could not be verified."));
  }
  return expected::makeValue(std::move(digest).assumeValue());
}
