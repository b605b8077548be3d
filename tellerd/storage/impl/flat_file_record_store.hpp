/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_FLAT_FILE_RECORD_STORE_HPP
#define TELLER_FLAT_FILE_RECORD_STORE_HPP

#include "storage/record_store.hpp"

#include <memory>

#include <boost/filesystem/path.hpp>
#include "logger/logger_fwd.hpp"
#include "storage/impl/csv_table.hpp"

namespace teller {
  namespace storage {

    /**
     * RecordStore over two delimited text files
     */
    class FlatFileRecordStore : public RecordStore {
      struct private_tag {};

     public:
      /**
       * Create the store, creating the parent directories of both tables
       * if needed. The tables themselves are created by initialize().
       * @param accounts_path - the accounts table file
       * @param transactions_path - the transactions log file
       * @param log - logger
       */
      static expected::Result<std::unique_ptr<FlatFileRecordStore>,
                              std::string>
      create(const boost::filesystem::path &accounts_path,
             const boost::filesystem::path &transactions_path,
             logger::LoggerPtr log);

      StorageResult<bool> initialize() override;

      StorageResult<std::vector<model::Account>> loadAccounts() const override;

      StorageResult<void> saveAccounts(
          const std::vector<model::Account> &accounts) override;

      StorageResult<void> appendTransaction(
          const model::TransactionRecord &record) override;

      StorageResult<std::vector<model::TransactionRecord>> loadTransactions(
          const model::types::AccountNumberType &account_number)
          const override;

      FlatFileRecordStore(const boost::filesystem::path &accounts_path,
                          const boost::filesystem::path &transactions_path,
                          private_tag,
                          logger::LoggerPtr log);

     private:
      CsvTable accounts_;
      CsvTable transactions_;
      logger::LoggerPtr log_;
    };

  }  // namespace storage
}  // namespace teller

#endif  // TELLER_FLAT_FILE_RECORD_STORE_HPP
