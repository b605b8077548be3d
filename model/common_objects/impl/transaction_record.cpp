/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common_objects/transaction_record.hpp"

#include <map>

#include "utils/string_builder.hpp"

namespace {
  using teller::model::TransactionDirection;
  using teller::model::TransactionType;

  const std::map<TransactionType, std::string> kTypeNames{
      {TransactionType::kDeposit, "Deposit"},
      {TransactionType::kWithdrawal, "Withdrawal"},
      {TransactionType::kTransfer, "Transfer"}};

  const std::map<TransactionDirection, std::string> kDirectionNames{
      {TransactionDirection::kCredit, "Credit"},
      {TransactionDirection::kDebit, "Debit"}};

  template <typename Enum>
  std::optional<Enum> findByName(const std::map<Enum, std::string> &names,
                                 std::string_view str) {
    for (const auto &entry : names) {
      if (entry.second == str) {
        return entry.first;
      }
    }
    return std::nullopt;
  }
}  // namespace

namespace teller {
  namespace model {

    std::string transactionTypeToString(TransactionType type) {
      return kTypeNames.at(type);
    }

    std::optional<TransactionType> transactionTypeFromString(
        std::string_view str) {
      return findByName(kTypeNames, str);
    }

    std::string transactionDirectionToString(TransactionDirection direction) {
      return kDirectionNames.at(direction);
    }

    std::optional<TransactionDirection> transactionDirectionFromString(
        std::string_view str) {
      return findByName(kDirectionNames, str);
    }

    TransactionRecord::TransactionRecord(
        types::TimestampType timestamp,
        types::AccountNumberType account_number,
        TransactionType type,
        Amount amount,
        std::optional<types::AccountNumberType> counterparty_account,
        TransactionDirection direction)
        : timestamp_(std::move(timestamp)),
          account_number_(std::move(account_number)),
          type_(type),
          amount_(std::move(amount)),
          counterparty_account_(std::move(counterparty_account)),
          direction_(direction) {}

    const types::TimestampType &TransactionRecord::timestamp() const {
      return timestamp_;
    }

    const types::AccountNumberType &TransactionRecord::accountNumber() const {
      return account_number_;
    }

    TransactionType TransactionRecord::type() const {
      return type_;
    }

    const Amount &TransactionRecord::amount() const {
      return amount_;
    }

    const std::optional<types::AccountNumberType>
        &TransactionRecord::counterpartyAccount() const {
      return counterparty_account_;
    }

    TransactionDirection TransactionRecord::direction() const {
      return direction_;
    }

    bool TransactionRecord::operator==(const TransactionRecord &rhs) const {
      return timestamp_ == rhs.timestamp_
          and account_number_ == rhs.account_number_ and type_ == rhs.type_
          and amount_ == rhs.amount_
          and counterparty_account_ == rhs.counterparty_account_
          and direction_ == rhs.direction_;
    }

    std::string TransactionRecord::toString() const {
      return detail::PrettyStringBuilder()
          .init("TransactionRecord")
          .appendNamed("timestamp", timestamp_)
          .appendNamed("account", account_number_)
          .appendNamed("type", transactionTypeToString(type_))
          .appendNamed("amount", amount_.toStringRepr())
          .appendNamed("counterparty", counterparty_account_)
          .appendNamed("direction", transactionDirectionToString(direction_))
          .finalize();
    }

  }  // namespace model
}  // namespace teller
