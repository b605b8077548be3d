/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_VALIDATION_ERROR_HPP
#define TELLER_VALIDATION_ERROR_HPP

#include <string>
#include <vector>

namespace teller {
  namespace validation {

    /// What exactly is wrong with the validated input
    enum class ValidationReason {
      kBadFormat,
      kNonPositive,
      kTooLarge,
      kPinNotUnique,
      kSelfTransfer,
      kNotConfirmed,
    };

    std::string reasonToString(ValidationReason reason);

    using ReasonType = std::string;
    using ReasonName = std::string;

    /// Represents a validation error.
    struct ValidationError {
      ValidationError(ReasonName name,
                      ValidationReason reason,
                      std::vector<ReasonType> errors);

      std::string toString() const;

      ReasonName name;                    ///< Validated field.
      ValidationReason reason;            ///< Error reason kind.
      std::vector<ReasonType> my_errors;  ///< Human readable details.
    };

  }  // namespace validation
}  // namespace teller

#endif  // TELLER_VALIDATION_ERROR_HPP
