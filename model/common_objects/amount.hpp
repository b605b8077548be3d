/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_MODEL_AMOUNT_HPP
#define TELLER_MODEL_AMOUNT_HPP

#include <memory>
#include <string>
#include <string_view>

#include "common_objects/types.hpp"

namespace teller {
  namespace model {

    /**
     * Unsigned fixed point decimal number. A value that could not be parsed
     * or computed is NaN: it is rendered as "NaN", has zero sign and is not
     * equal to anything.
     */
    class Amount final {
     public:
      /// Parse a plain decimal like "120", "0.5" or "10000.00".
      explicit Amount(std::string_view amount);

      /// Zero with the given number of fractional digits.
      explicit Amount(types::PrecisionType precision);

      Amount(Amount const &other);

      Amount(Amount &&other) noexcept;

      Amount &operator=(Amount const &other);

      Amount &operator=(Amount &&other) noexcept;

      ~Amount();

      /// @return false for NaN
      bool isValid() const;

      /// @return 1 if positive, 0 if zero or NaN
      int sign() const;

      /// @return the number of fractional digits
      types::PrecisionType precision() const;

      /// @return canonical text, e.g. "10.50", or "NaN"
      std::string const &toStringRepr() const;

      /**
       * Change the number of fractional digits. Going down is only
       * possible when the dropped digits are zero, otherwise NaN is
       * returned.
       */
      Amount rescaled(types::PrecisionType precision) const;

      /// Sum, the result precision is the greater of both.
      Amount &operator+=(Amount const &other);

      /// Difference, a negative result is NaN.
      Amount &operator-=(Amount const &other);

      bool operator==(Amount const &rhs) const;

      bool operator!=(Amount const &rhs) const;

      /// Numeric comparison, false if either side is NaN.
      bool operator<(Amount const &rhs) const;

      std::string toString() const;

     private:
      struct Impl;
      explicit Amount(std::unique_ptr<Impl> impl);

      std::unique_ptr<Impl> impl_;
    };

  }  // namespace model
}  // namespace teller

#endif  // TELLER_MODEL_AMOUNT_HPP
