/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cryptography/pin_hasher.hpp"

#include <gtest/gtest.h>
#include "framework/result_gtest_checkers.hpp"
#include "validators/field_validator.hpp"

using teller::crypto::PinHasher;

/**
 * @given a PIN
 * @when it is hashed
 * @then the result is the lowercase hex SHA-256 digest of the PIN text
 */
TEST(PinHasherTest, KnownDigest) {
  auto result = PinHasher{}.hash("1234");
  TELLER_ASSERT_RESULT_VALUE(result);
  EXPECT_EQ(result.assumeValue(),
            "03ac674216f3e15c761ee1a5e255f067953623c8b388b4459e13f978d7c846f4");
  EXPECT_FALSE(
      teller::validation::FieldValidator{}.validatePinHash(result.assumeValue()));
}

/**
 * @given two different PINs
 * @when they are hashed twice
 * @then equal PINs give equal digests and different PINs differ
 */
TEST(PinHasherTest, Deterministic) {
  PinHasher hasher;
  auto a1 = hasher.hash("5678");
  auto a2 = hasher.hash("5678");
  auto b = hasher.hash("8765");
  TELLER_ASSERT_RESULT_VALUE(a1);
  TELLER_ASSERT_RESULT_VALUE(a2);
  TELLER_ASSERT_RESULT_VALUE(b);
  EXPECT_EQ(a1.assumeValue(), a2.assumeValue());
  EXPECT_NE(a1.assumeValue(), b.assumeValue());
}
