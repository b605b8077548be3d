/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/to_string.hpp"

#include <optional>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

const std::string kTestString("test");

struct MockToStringable {
  MOCK_CONST_METHOD0(toString, std::string());
};

using namespace teller::to_string;

/**
 * @given std::string
 * @when toString is called on it
 * @then result equals argument
 */
TEST(ToStringTest, StdString) {
  const std::string string("987654321");
  ASSERT_EQ(toString(string), string);
}

/**
 * @given several plain types that std::to_string accepts
 * @when toString is called on them
 * @then they are converted as std::to_string does
 */
TEST(ToStringTest, PlainValues) {
  auto test = [](auto o) { EXPECT_EQ(toString(o), std::to_string(o)); };
  test(404);
  test(-273);
  test(3u);
  EXPECT_EQ(toString(true), "true");
}

/**
 * @given ToStringable object
 * @when toString is called on it
 * @then result equals expected string
 */
TEST(ToStringTest, ToStringMethod) {
  MockToStringable obj;
  EXPECT_CALL(obj, toString()).WillOnce(::testing::Return(kTestString));
  EXPECT_EQ(toString(obj), kTestString);
}

/**
 * @given set and unset optionals
 * @when toString is called on them
 * @then the value or the not set marker is printed
 */
TEST(ToStringTest, Optional) {
  EXPECT_EQ(toString(std::optional<std::string>{"123456789"}), "123456789");
  EXPECT_EQ(toString(std::optional<std::string>{}), "(not set)");
}

/**
 * @given a vector of strings
 * @when toString is called on it
 * @then the elements are listed in brackets
 */
TEST(ToStringTest, Vector) {
  std::vector<std::string> vec;
  EXPECT_EQ(toString(vec), "[]");
  vec.emplace_back("el1");
  vec.emplace_back("el2");
  EXPECT_EQ(toString(vec), "[el1, el2]");
}
