/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/impl/flat_file_record_store.hpp"

#include <fmt/core.h>
#include "common/files.hpp"
#include "common/result_try.hpp"
#include "logger/logger.hpp"
#include "storage/impl/record_codec.hpp"

using namespace teller::storage;

namespace {
  StorageError rowError(const CsvTable &table,
                        const CsvTable::Record &record,
                        const std::string &message) {
    return StorageError{table.path().string(),
                        fmt::format("line {}: {}", record.line, message)};
  }
}  // namespace

teller::expected::Result<std::unique_ptr<FlatFileRecordStore>, std::string>
FlatFileRecordStore::create(const boost::filesystem::path &accounts_path,
                            const boost::filesystem::path &transactions_path,
                            logger::LoggerPtr log) {
  for (const auto &path : {accounts_path, transactions_path}) {
    TELLER_EXPECTED_ERROR_CHECK(ensure_directory(path.parent_path(), log));
  }
  return expected::makeValue(std::make_unique<FlatFileRecordStore>(
      accounts_path, transactions_path, private_tag{}, std::move(log)));
}

FlatFileRecordStore::FlatFileRecordStore(
    const boost::filesystem::path &accounts_path,
    const boost::filesystem::path &transactions_path,
    private_tag,
    logger::LoggerPtr log)
    : accounts_(accounts_path, accountsHeader(), log),
      transactions_(transactions_path, transactionsHeader(), log),
      log_(std::move(log)) {}

StorageResult<bool> FlatFileRecordStore::initialize() {
  TELLER_EXPECTED_TRY_GET_VALUE(accounts_created, accounts_.initialize());
  TELLER_EXPECTED_ERROR_CHECK(transactions_.initialize());
  return expected::makeValue(accounts_created);
}

StorageResult<std::vector<teller::model::Account>>
FlatFileRecordStore::loadAccounts() const {
  TELLER_EXPECTED_TRY_GET_VALUE(records, accounts_.readRows());

  std::vector<model::Account> accounts;
  accounts.reserve(records.size());
  for (const auto &record : records) {
    auto account = decodeAccount(record.fields);
    if (expected::hasError(account)) {
      auto error = rowError(accounts_, record, account.assumeError());
      log_->error("cannot load accounts: {}", error);
      return expected::makeError(std::move(error));
    }
    accounts.push_back(std::move(account).assumeValue());
  }
  log_->debug("loaded {} accounts", accounts.size());
  return expected::makeValue(std::move(accounts));
}

StorageResult<void> FlatFileRecordStore::saveAccounts(
    const std::vector<model::Account> &accounts) {
  std::vector<CsvTable::Row> rows;
  rows.reserve(accounts.size());
  for (const auto &account : accounts) {
    rows.push_back(encodeAccount(account));
  }
  auto result = accounts_.writeRows(rows);
  if (auto e = expected::resultToOptionalError(result)) {
    log_->error("cannot save accounts: {}", e.value());
  }
  return result;
}

StorageResult<void> FlatFileRecordStore::appendTransaction(
    const model::TransactionRecord &record) {
  auto result = transactions_.appendRow(encodeTransaction(record));
  if (auto e = expected::resultToOptionalError(result)) {
    log_->error("cannot append {}: {}", record, e.value());
  } else {
    log_->debug("appended {}", record);
  }
  return result;
}

StorageResult<std::vector<teller::model::TransactionRecord>>
FlatFileRecordStore::loadTransactions(
    const model::types::AccountNumberType &account_number) const {
  TELLER_EXPECTED_TRY_GET_VALUE(empty, transactions_.isEmpty());
  if (empty) {
    return expected::makeValue(std::vector<model::TransactionRecord>{});
  }
  TELLER_EXPECTED_TRY_GET_VALUE(records, transactions_.readRows());

  std::vector<model::TransactionRecord> history;
  for (const auto &record : records) {
    auto transaction = decodeTransaction(record.fields);
    if (expected::hasError(transaction)) {
      auto error = rowError(transactions_, record, transaction.assumeError());
      log_->error("cannot load transactions: {}", error);
      return expected::makeError(std::move(error));
    }
    if (transaction.assumeValue().accountNumber() == account_number) {
      history.push_back(std::move(transaction).assumeValue());
    }
  }
  return expected::makeValue(std::move(history));
}
