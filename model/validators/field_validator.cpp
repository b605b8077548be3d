/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "validators/field_validator.hpp"

#include <regex>
#include <string>

#include <fmt/core.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include "common_objects/types.hpp"

namespace {
  using teller::validation::ValidationError;
  using teller::validation::ValidationReason;

  class RegexValidator {
   public:
    RegexValidator(std::string name,
                   std::string pattern,
                   std::string format_description)
        : name_(std::move(name)),
          pattern_(std::move(pattern)),
          regex_(pattern_),
          format_description_(std::move(format_description)) {}

    std::optional<ValidationError> validate(std::string_view value) const {
      if (not std::regex_match(value.begin(), value.end(), regex_)) {
        return ValidationError(
            name_,
            ValidationReason::kBadFormat,
            {format_description_});
      }
      return std::nullopt;
    }

   private:
    std::string name_;
    std::string pattern_;
    std::regex regex_;
    std::string format_description_;
  };

  const RegexValidator kAccountNumberValidator{
      "AccountNumber",
      R"#([0-9]{9})#",
      "Account number must consist of exactly 9 digits."};
  const RegexValidator kPinValidator{
      "Pin", R"#([0-9]{4})#", "PIN must be 4 digits."};
  const RegexValidator kPinHashValidator{
      "PinHash", R"#([0-9a-f]{64})#", "Expected a hex SHA-256 digest."};

  const std::string kAmountFormatDescription =
      "Invalid amount format. Use numbers (e.g., 10 or 10.50).";
  const char kDecimalSeparator = '.';
  const size_t kMaxFractionDigits = 2;

  /// Digits, optionally followed by a dot and one or two digits. The input
  /// length is unbounded, so the check is a single linear pass.
  bool isPlainDecimal(std::string_view amount) {
    const auto dot_pos = amount.find(kDecimalSeparator);
    const auto integer = amount.substr(0, dot_pos);
    if (integer.empty()
        or not boost::algorithm::all(integer, boost::is_digit())) {
      return false;
    }
    if (dot_pos == std::string_view::npos) {
      return true;
    }
    const auto fraction = amount.substr(dot_pos + 1);
    return not fraction.empty() and fraction.size() <= kMaxFractionDigits
        and boost::algorithm::all(fraction, boost::is_digit());
  }
}  // namespace

namespace teller {
  namespace validation {

    const model::Amount FieldValidator::kMaxOperationAmount{"10000.00"};

    std::optional<ValidationError> FieldValidator::validateAccountNumber(
        std::string_view account_number) const {
      return kAccountNumberValidator.validate(account_number);
    }

    std::optional<ValidationError> FieldValidator::validatePin(
        std::string_view pin) const {
      // the value itself is a secret and never becomes a part of the message
      return kPinValidator.validate(pin);
    }

    std::optional<ValidationError> FieldValidator::validatePinHash(
        std::string_view pin_hash) const {
      return kPinHashValidator.validate(pin_hash);
    }

    std::optional<ValidationError> FieldValidator::validateAmount(
        std::string_view amount) const {
      if (not isPlainDecimal(amount)) {
        return ValidationError(
            "Amount", ValidationReason::kBadFormat, {kAmountFormatDescription});
      }
      model::Amount value(amount);
      // a well formed amount is only invalid when it overflows
      if (not value.isValid() or kMaxOperationAmount < value) {
        return ValidationError(
            "Amount",
            ValidationReason::kTooLarge,
            {fmt::format("Amount exceeds limit ({}).",
                         kMaxOperationAmount.toStringRepr())});
      }
      if (value.sign() <= 0) {
        return ValidationError("Amount",
                               ValidationReason::kNonPositive,
                               {"Amount must be positive."});
      }
      return std::nullopt;
    }

    expected::Result<model::Amount, ValidationError>
    FieldValidator::parseAmount(std::string_view amount) const {
      if (auto error = validateAmount(amount)) {
        return expected::makeError(std::move(error).value());
      }
      return expected::makeValue(
          model::Amount(amount).rescaled(model::kMoneyPrecision));
    }

  }  // namespace validation
}  // namespace teller
