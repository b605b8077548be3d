/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/impl/record_codec.hpp"

#include <fmt/core.h>

namespace {
  using teller::model::Amount;

  enum AccountColumn {
    kAccountNumber,
    kName,
    kPinHash,
    kAddress,
    kBalance,
    kIsDeleted,
    kAccountColumns
  };

  enum TransactionColumn {
    kTimestamp,
    kType,
    kAmount,
    kCounterparty,
    kDirection,
    kTxAccountNumber,
    kTransactionColumns
  };

  const std::string kDeletedFlag = "1";
  const std::string kActiveFlag = "0";

  /// Money on disk is non-negative with at most two fractional digits.
  teller::expected::Result<Amount, std::string> decodeMoney(
      const std::string &column, const std::string &text) {
    Amount value(text);
    if (not value.isValid()) {
      return teller::expected::makeError(
          fmt::format("{} `{}' is not a non-negative number", column, text));
    }
    if (value.precision() > teller::model::kMoneyPrecision) {
      return teller::expected::makeError(
          fmt::format("{} `{}' has more than {} decimal places",
                      column,
                      text,
                      static_cast<int>(teller::model::kMoneyPrecision)));
    }
    return teller::expected::makeValue(
        value.rescaled(teller::model::kMoneyPrecision));
  }
}  // namespace

namespace teller {
  namespace storage {

    const CsvTable::Row &accountsHeader() {
      static const CsvTable::Row kHeader{"account_number",
                                         "name",
                                         "pin_hash",
                                         "address",
                                         "balance",
                                         "is_deleted"};
      return kHeader;
    }

    const CsvTable::Row &transactionsHeader() {
      static const CsvTable::Row kHeader{"timestamp",
                                         "type",
                                         "amount",
                                         "counterparty_account",
                                         "direction",
                                         "account_number"};
      return kHeader;
    }

    CsvTable::Row encodeAccount(const model::Account &account) {
      return {account.accountNumber(),
              account.name(),
              account.pinHash(),
              account.address(),
              account.balance().rescaled(model::kMoneyPrecision).toStringRepr(),
              account.isDeleted() ? kDeletedFlag : kActiveFlag};
    }

    expected::Result<model::Account, std::string> decodeAccount(
        const CsvTable::Row &row) {
      if (row.size() != kAccountColumns) {
        return expected::makeError(fmt::format(
            "expected {} fields, got {}",
            static_cast<int>(kAccountColumns),
            row.size()));
      }

      auto balance = decodeMoney("balance", row[kBalance]);
      if (expected::hasError(balance)) {
        return expected::makeError(std::move(balance).assumeError());
      }

      const auto &flag = row[kIsDeleted];
      if (flag != kDeletedFlag and flag != kActiveFlag) {
        return expected::makeError(
            fmt::format("is_deleted must be 0 or 1, got `{}'", flag));
      }

      return expected::makeValue(model::Account(row[kAccountNumber],
                                                row[kName],
                                                row[kPinHash],
                                                row[kAddress],
                                                std::move(balance).assumeValue(),
                                                flag == kDeletedFlag));
    }

    CsvTable::Row encodeTransaction(const model::TransactionRecord &record) {
      return {record.timestamp(),
              model::transactionTypeToString(record.type()),
              record.amount().rescaled(model::kMoneyPrecision).toStringRepr(),
              record.counterpartyAccount().value_or(std::string{}),
              model::transactionDirectionToString(record.direction()),
              record.accountNumber()};
    }

    expected::Result<model::TransactionRecord, std::string> decodeTransaction(
        const CsvTable::Row &row) {
      if (row.size() != kTransactionColumns) {
        return expected::makeError(fmt::format(
            "expected {} fields, got {}",
            static_cast<int>(kTransactionColumns),
            row.size()));
      }

      auto type = model::transactionTypeFromString(row[kType]);
      if (not type) {
        return expected::makeError(
            fmt::format("unknown transaction type `{}'", row[kType]));
      }
      auto direction = model::transactionDirectionFromString(row[kDirection]);
      if (not direction) {
        return expected::makeError(
            fmt::format("unknown direction `{}'", row[kDirection]));
      }
      auto amount = decodeMoney("amount", row[kAmount]);
      if (expected::hasError(amount)) {
        return expected::makeError(std::move(amount).assumeError());
      }

      std::optional<model::types::AccountNumberType> counterparty;
      if (not row[kCounterparty].empty()) {
        counterparty = row[kCounterparty];
      }
      return expected::makeValue(
          model::TransactionRecord(row[kTimestamp],
                                   row[kTxAccountNumber],
                                   *type,
                                   std::move(amount).assumeValue(),
                                   std::move(counterparty),
                                   *direction));
    }

  }  // namespace storage
}  // namespace teller
