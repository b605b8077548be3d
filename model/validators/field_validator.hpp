/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_FIELD_VALIDATOR_HPP
#define TELLER_FIELD_VALIDATOR_HPP

#include <optional>
#include <string_view>

#include "common/result.hpp"
#include "common_objects/amount.hpp"
#include "validators/validation_error.hpp"

namespace teller {
  namespace validation {

    /**
     * Validates the raw text fields entered at the terminal or read from
     * the tables.
     */
    class FieldValidator {
     public:
      /// The greatest amount of a single deposit, withdrawal or transfer
      static const model::Amount kMaxOperationAmount;

      /// Exactly nine decimal digits.
      std::optional<ValidationError> validateAccountNumber(
          std::string_view account_number) const;

      /// Exactly four decimal digits.
      std::optional<ValidationError> validatePin(std::string_view pin) const;

      /// 64 lowercase hex digits.
      std::optional<ValidationError> validatePinHash(
          std::string_view pin_hash) const;

      /**
       * A plain decimal with at most two fractional digits which is greater
       * than zero and does not exceed kMaxOperationAmount.
       */
      std::optional<ValidationError> validateAmount(
          std::string_view amount) const;

      /**
       * Validate the amount and convert it to the money precision.
       * @return the amount with exactly two fractional digits
       */
      expected::Result<model::Amount, ValidationError> parseAmount(
          std::string_view amount) const;
    };

  }  // namespace validation
}  // namespace teller

#endif  // TELLER_FIELD_VALIDATOR_HPP
