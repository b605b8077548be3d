/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_RECORD_CODEC_HPP
#define TELLER_RECORD_CODEC_HPP

#include "common/result.hpp"
#include "common_objects/account.hpp"
#include "common_objects/transaction_record.hpp"
#include "storage/impl/csv_table.hpp"

namespace teller {
  namespace storage {

    /// account_number,name,pin_hash,address,balance,is_deleted
    const CsvTable::Row &accountsHeader();

    /// timestamp,type,amount,counterparty_account,direction,account_number
    const CsvTable::Row &transactionsHeader();

    CsvTable::Row encodeAccount(const model::Account &account);

    /// @return the account or a description of the malformed field
    expected::Result<model::Account, std::string> decodeAccount(
        const CsvTable::Row &row);

    CsvTable::Row encodeTransaction(const model::TransactionRecord &record);

    /// @return the record or a description of the malformed field
    expected::Result<model::TransactionRecord, std::string> decodeTransaction(
        const CsvTable::Row &row);

  }  // namespace storage
}  // namespace teller

#endif  // TELLER_RECORD_CODEC_HPP
