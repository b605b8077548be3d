/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_MODEL_TYPES_HPP
#define TELLER_MODEL_TYPES_HPP

#include <cstdint>
#include <string>

namespace teller {
  namespace model {

    class Account;
    class Amount;
    class TransactionRecord;

    namespace types {
      /// Type of account number, nine decimal digits
      using AccountNumberType = std::string;
      /// Type of account holder name
      using AccountNameType = std::string;
      /// Type of postal address
      using AddressType = std::string;
      /// Lowercase hex SHA-256 digest of a PIN
      using PinHashType = std::string;
      /// Type of precision
      using PrecisionType = uint8_t;
      /// Local time formatted as YYYY-MM-DD HH:MM:SS
      using TimestampType = std::string;
    }  // namespace types

    /// Fractional digits of every stored money value
    constexpr types::PrecisionType kMoneyPrecision = 2;

  }  // namespace model
}  // namespace teller

#endif  // TELLER_MODEL_TYPES_HPP
