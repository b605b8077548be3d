/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_MOCK_RECORD_STORE_HPP
#define TELLER_MOCK_RECORD_STORE_HPP

#include "storage/record_store.hpp"

#include <gmock/gmock.h>

namespace teller {
  namespace storage {

    class MockRecordStore : public RecordStore {
     public:
      MOCK_METHOD(StorageResult<bool>, initialize, (), (override));
      MOCK_METHOD(StorageResult<std::vector<model::Account>>,
                  loadAccounts,
                  (),
                  (const, override));
      MOCK_METHOD(StorageResult<void>,
                  saveAccounts,
                  (const std::vector<model::Account> &),
                  (override));
      MOCK_METHOD(StorageResult<void>,
                  appendTransaction,
                  (const model::TransactionRecord &),
                  (override));
      MOCK_METHOD(StorageResult<std::vector<model::TransactionRecord>>,
                  loadTransactions,
                  (const model::types::AccountNumberType &),
                  (const, override));
    };

  }  // namespace storage
}  // namespace teller

#endif  // TELLER_MOCK_RECORD_STORE_HPP
