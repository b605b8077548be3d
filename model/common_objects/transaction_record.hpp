/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_MODEL_TRANSACTION_RECORD_HPP
#define TELLER_MODEL_TRANSACTION_RECORD_HPP

#include <optional>
#include <string>
#include <string_view>

#include "common_objects/amount.hpp"
#include "common_objects/types.hpp"

namespace teller {
  namespace model {

    enum class TransactionType { kDeposit, kWithdrawal, kTransfer };

    /// Whether the money came into or left the logged account
    enum class TransactionDirection { kCredit, kDebit };

    std::string transactionTypeToString(TransactionType type);

    std::optional<TransactionType> transactionTypeFromString(
        std::string_view str);

    std::string transactionDirectionToString(TransactionDirection direction);

    std::optional<TransactionDirection> transactionDirectionFromString(
        std::string_view str);

    /**
     * One row of the transactions log. A transfer produces two records,
     * one per participating account, pointing at each other through the
     * counterparty.
     */
    class TransactionRecord final {
     public:
      TransactionRecord(
          types::TimestampType timestamp,
          types::AccountNumberType account_number,
          TransactionType type,
          Amount amount,
          std::optional<types::AccountNumberType> counterparty_account,
          TransactionDirection direction);

      const types::TimestampType &timestamp() const;

      /// @return the account whose history the record belongs to
      const types::AccountNumberType &accountNumber() const;

      TransactionType type() const;

      const Amount &amount() const;

      /// @return the other side of a transfer, unset otherwise
      const std::optional<types::AccountNumberType> &counterpartyAccount()
          const;

      TransactionDirection direction() const;

      bool operator==(const TransactionRecord &rhs) const;

      std::string toString() const;

     private:
      types::TimestampType timestamp_;
      types::AccountNumberType account_number_;
      TransactionType type_;
      Amount amount_;
      std::optional<types::AccountNumberType> counterparty_account_;
      TransactionDirection direction_;
    };

  }  // namespace model
}  // namespace teller

#endif  // TELLER_MODEL_TRANSACTION_RECORD_HPP
