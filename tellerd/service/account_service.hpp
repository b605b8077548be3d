/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_ACCOUNT_SERVICE_HPP
#define TELLER_ACCOUNT_SERVICE_HPP

#include <string>
#include <vector>

#include "common/result.hpp"
#include "common_objects/account.hpp"
#include "common_objects/transaction_record.hpp"
#include "service/service_error.hpp"

namespace teller {
  namespace service {

    /// Both sides of a completed transfer
    struct TransferOutcome {
      model::Account source;
      model::Account target;
    };

    /**
     * Business rules of the teller. Every operation on a session account
     * works on the freshly loaded table rows, the passed account is only
     * used to identify the row.
     */
    class AccountService {
     public:
      template <typename T>
      using ServiceResult = expected::Result<T, ServiceError>;

      virtual ~AccountService() = default;

      /**
       * Log in.
       * @param account_number - entered account number
       * @param pin - entered PIN, exactly four digits
       * @return the active account with this number and PIN
       */
      virtual ServiceResult<model::Account> authenticate(
          const std::string &account_number, const std::string &pin) = 0;

      /// @return the balance of the given record, without reloading it
      virtual ServiceResult<model::Amount> checkBalance(
          const model::Account &account) const = 0;

      /**
       * Put money on the account.
       * @param amount - entered amount text
       * @return the updated account
       */
      virtual ServiceResult<model::Account> deposit(
          const model::Account &account, const std::string &amount) = 0;

      /**
       * Take money from the account. The balance cannot go below zero.
       * @return the updated account
       */
      virtual ServiceResult<model::Account> withdraw(
          const model::Account &account, const std::string &amount) = 0;

      /**
       * Move money to another active account.
       * @param target_account_number - the receiving account
       * @param amount - entered amount text
       */
      virtual ServiceResult<TransferOutcome> transfer(
          const model::Account &account,
          const std::string &target_account_number,
          const std::string &amount) = 0;

      /**
       * Replace the PIN. No other active account may use the same PIN.
       * @return the updated account
       */
      virtual ServiceResult<model::Account> changePin(
          const model::Account &account, const std::string &new_pin) = 0;

      /**
       * Mark the account deleted. Nothing changes unless confirmed.
       * @return the deleted account
       */
      virtual ServiceResult<model::Account> softDelete(
          const model::Account &account, bool confirmed) = 0;

      /// @return log records of the account, oldest first
      virtual ServiceResult<std::vector<model::TransactionRecord>>
      transactionHistory(const model::Account &account) const = 0;
    };

  }  // namespace service
}  // namespace teller

#endif  // TELLER_ACCOUNT_SERVICE_HPP
