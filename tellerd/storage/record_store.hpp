/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_RECORD_STORE_HPP
#define TELLER_RECORD_STORE_HPP

#include <vector>

#include "common_objects/account.hpp"
#include "common_objects/transaction_record.hpp"
#include "storage/storage_error.hpp"

namespace teller {
  namespace storage {

    /**
     * Persistence of the accounts table and the transactions log. Accounts
     * are read and written as a whole snapshot, the log only grows.
     */
    class RecordStore {
     public:
      virtual ~RecordStore() = default;

      /**
       * Create the missing tables and check the headers of existing ones.
       * Calling it again on initialized tables changes nothing.
       * @return true if the accounts table has just been created
       */
      virtual StorageResult<bool> initialize() = 0;

      /// @return every account row, soft deleted included, in file order
      virtual StorageResult<std::vector<model::Account>> loadAccounts()
          const = 0;

      /// Replace the accounts table with the given snapshot.
      virtual StorageResult<void> saveAccounts(
          const std::vector<model::Account> &accounts) = 0;

      /// Append one row to the transactions log.
      virtual StorageResult<void> appendTransaction(
          const model::TransactionRecord &record) = 0;

      /**
       * @return records of the given account in chronological order, empty
       * if the log does not exist yet
       */
      virtual StorageResult<std::vector<model::TransactionRecord>>
      loadTransactions(
          const model::types::AccountNumberType &account_number) const = 0;
    };

  }  // namespace storage
}  // namespace teller

#endif  // TELLER_RECORD_STORE_HPP
