/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/impl/flat_file_record_store.hpp"

#include <fstream>

#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include "common/files.hpp"
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_logger.hpp"

using namespace teller::storage;
using teller::model::Account;
using teller::model::Amount;
using teller::model::TransactionDirection;
using teller::model::TransactionRecord;
using teller::model::TransactionType;

class FlatFileRecordStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto result = FlatFileRecordStore::create(
        accounts_path, transactions_path, getTestLogger("RecordStore"));
    TELLER_ASSERT_RESULT_VALUE(result);
    store = std::move(result).assumeValue();
  }

  void TearDown() override {
    boost::filesystem::remove_all(test_dir);
  }

  void writeAccountsFile(const std::string &text) {
    std::ofstream out(accounts_path.string(), std::ios::trunc);
    out << text;
  }

  Account makeAccount(const std::string &number,
                      const std::string &address,
                      const std::string &balance,
                      bool deleted = false) {
    return Account(number,
                   "Holder " + number,
                   std::string(64, 'a'),
                   address,
                   Amount{balance},
                   deleted);
  }

  const boost::filesystem::path test_dir =
      boost::filesystem::temp_directory_path()
      / boost::filesystem::unique_path();
  const boost::filesystem::path accounts_path = test_dir / "data" / "users.csv";
  const boost::filesystem::path transactions_path =
      test_dir / "data" / "transactions.csv";
  std::unique_ptr<FlatFileRecordStore> store;
};

/**
 * @given a store over a missing directory
 * @when it is initialized twice
 * @then both tables are created with headers once, and the second call
 * reports that the accounts table already existed
 */
TEST_F(FlatFileRecordStoreTest, InitializeIsIdempotent) {
  auto first = store->initialize();
  TELLER_ASSERT_RESULT_VALUE(first);
  EXPECT_TRUE(first.assumeValue());
  EXPECT_EQ(teller::readTextFile(accounts_path).assumeValue(),
            "account_number,name,pin_hash,address,balance,is_deleted\n");
  EXPECT_EQ(teller::readTextFile(transactions_path).assumeValue(),
            "timestamp,type,amount,counterparty_account,direction,"
            "account_number\n");

  TELLER_ASSERT_RESULT_VALUE(
      store->saveAccounts({makeAccount("987654321", "Karachi", "5.00")}));
  auto second = store->initialize();
  TELLER_ASSERT_RESULT_VALUE(second);
  EXPECT_FALSE(second.assumeValue());

  auto accounts = store->loadAccounts();
  TELLER_ASSERT_RESULT_VALUE(accounts);
  EXPECT_EQ(accounts.assumeValue().size(), 1u);
}

/**
 * @given accounts with quoted addresses, deleted flags and short balances
 * @when they are saved and loaded
 * @then the same accounts in the same order are returned, with money
 * precision balances
 */
TEST_F(FlatFileRecordStoreTest, SaveAndLoadAccounts) {
  ASSERT_TRUE(teller::expected::hasValue(store->initialize()));
  const std::vector<Account> accounts{
      makeAccount("987654321", "123 Main St, Karachi", "10.5"),
      makeAccount("123456789", "456 Gulshan Ave, Lahore", "0.00", true)};
  TELLER_ASSERT_RESULT_VALUE(store->saveAccounts(accounts));

  auto loaded = store->loadAccounts();
  TELLER_ASSERT_RESULT_VALUE(loaded);
  EXPECT_EQ(loaded.assumeValue(), accounts);
  EXPECT_EQ(loaded.assumeValue()[0].balance().toStringRepr(), "10.50");
  EXPECT_TRUE(loaded.assumeValue()[1].isDeleted());
}

/**
 * @given an accounts table with an invalid balance
 * @when accounts are loaded
 * @then a storage error names the file and the line
 */
TEST_F(FlatFileRecordStoreTest, MalformedBalance) {
  writeAccountsFile(
      "account_number,name,pin_hash,address,balance,is_deleted\n"
      "987654321,A,hash,addr,ten,0\n");
  auto loaded = store->loadAccounts();
  TELLER_ASSERT_RESULT_ERROR(loaded);
  EXPECT_EQ(loaded.assumeError().path, accounts_path.string());
  EXPECT_NE(loaded.assumeError().message.find("line 2"), std::string::npos);
}

/**
 * @given an accounts table with an invalid deleted flag
 * @when accounts are loaded
 * @then a storage error is returned
 */
TEST_F(FlatFileRecordStoreTest, MalformedDeletedFlag) {
  writeAccountsFile(
      "account_number,name,pin_hash,address,balance,is_deleted\n"
      "987654321,A,hash,addr,1.00,yes\n");
  TELLER_ASSERT_RESULT_ERROR(store->loadAccounts());
}

/**
 * @given an accounts table with too many fields in a row
 * @when accounts are loaded
 * @then a storage error is returned
 */
TEST_F(FlatFileRecordStoreTest, MalformedColumnCount) {
  writeAccountsFile(
      "account_number,name,pin_hash,address,balance,is_deleted\n"
      "987654321,A,hash,Main St, Karachi,1.00,0\n");
  TELLER_ASSERT_RESULT_ERROR(store->loadAccounts());
}

/**
 * @given transaction records of two accounts
 * @when the history of one of them is loaded
 * @then only its records are returned in append order
 */
TEST_F(FlatFileRecordStoreTest, TransactionsAreFilteredByAccount) {
  ASSERT_TRUE(teller::expected::hasValue(store->initialize()));
  const TransactionRecord deposit{"2024-01-01 10:00:00",
                                  "123456789",
                                  TransactionType::kDeposit,
                                  Amount{"100.00"},
                                  std::nullopt,
                                  TransactionDirection::kCredit};
  const TransactionRecord debit{"2024-01-01 10:05:00",
                                "123456789",
                                TransactionType::kTransfer,
                                Amount{"40.00"},
                                std::string{"987654321"},
                                TransactionDirection::kDebit};
  const TransactionRecord credit{"2024-01-01 10:05:00",
                                 "987654321",
                                 TransactionType::kTransfer,
                                 Amount{"40.00"},
                                 std::string{"123456789"},
                                 TransactionDirection::kCredit};
  for (const auto &record : {deposit, debit, credit}) {
    TELLER_ASSERT_RESULT_VALUE(store->appendTransaction(record));
  }

  auto history = store->loadTransactions("123456789");
  TELLER_ASSERT_RESULT_VALUE(history);
  EXPECT_EQ(history.assumeValue(),
            (std::vector<TransactionRecord>{deposit, debit}));

  auto other = store->loadTransactions("987654321");
  TELLER_ASSERT_RESULT_VALUE(other);
  EXPECT_EQ(other.assumeValue(), (std::vector<TransactionRecord>{credit}));
}

/**
 * @given no transactions file
 * @when history is loaded
 * @then it is empty
 */
TEST_F(FlatFileRecordStoreTest, MissingTransactionsFile) {
  auto history = store->loadTransactions("123456789");
  TELLER_ASSERT_RESULT_VALUE(history);
  EXPECT_TRUE(history.assumeValue().empty());
}

/**
 * @given a transactions file of zero size
 * @when history is loaded
 * @then it is empty, the same as for a missing file
 */
TEST_F(FlatFileRecordStoreTest, EmptyTransactionsFile) {
  boost::filesystem::create_directories(transactions_path.parent_path());
  std::ofstream(transactions_path.string(), std::ios::trunc);
  ASSERT_TRUE(boost::filesystem::exists(transactions_path));

  auto history = store->loadTransactions("123456789");
  TELLER_ASSERT_RESULT_VALUE(history);
  EXPECT_TRUE(history.assumeValue().empty());
}

/**
 * @given an initialized store
 * @when a transfer record is appended
 * @then the row keeps the column order of the header with the owning
 * account last
 */
TEST_F(FlatFileRecordStoreTest, TransactionRowLayout) {
  ASSERT_TRUE(teller::expected::hasValue(store->initialize()));
  TELLER_ASSERT_RESULT_VALUE(
      store->appendTransaction(TransactionRecord{"2024-01-01 10:05:00",
                                                 "123456789",
                                                 TransactionType::kTransfer,
                                                 Amount{"40"},
                                                 std::string{"987654321"},
                                                 TransactionDirection::kDebit}));
  EXPECT_EQ(teller::readTextFile(transactions_path).assumeValue(),
            "timestamp,type,amount,counterparty_account,direction,"
            "account_number\n"
            "2024-01-01 10:05:00,Transfer,40.00,987654321,Debit,123456789\n");
}
