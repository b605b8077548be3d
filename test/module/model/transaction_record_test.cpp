/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common_objects/transaction_record.hpp"

#include <gtest/gtest.h>
#include "common_objects/account.hpp"

using namespace teller::model;

/**
 * @given every transaction type and direction
 * @when it is converted to its table name and back
 * @then the original value is restored, unknown names are rejected
 */
TEST(TransactionRecordTest, EnumNames) {
  for (auto type : {TransactionType::kDeposit,
                    TransactionType::kWithdrawal,
                    TransactionType::kTransfer}) {
    EXPECT_EQ(transactionTypeFromString(transactionTypeToString(type)), type);
  }
  EXPECT_EQ(transactionTypeToString(TransactionType::kWithdrawal),
            "Withdrawal");
  EXPECT_FALSE(transactionTypeFromString("deposit"));

  EXPECT_EQ(transactionDirectionToString(TransactionDirection::kCredit),
            "Credit");
  EXPECT_EQ(transactionDirectionFromString("Debit"),
            TransactionDirection::kDebit);
  EXPECT_FALSE(transactionDirectionFromString("Refund"));
}

/**
 * @given an account
 * @when it is printed
 * @then the PIN digest is not a part of the output
 */
TEST(TransactionRecordTest, AccountPrintHidesPinHash) {
  const std::string pin_hash(64, 'f');
  Account account{
      "987654321", "Saqlain Rai", pin_hash, "Karachi", Amount{"5.00"}, false};
  auto printed = account.toString();
  EXPECT_EQ(printed.find(pin_hash), std::string::npos);
  EXPECT_NE(printed.find("987654321"), std::string::npos);
}
