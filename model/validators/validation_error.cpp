/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "validators/validation_error.hpp"

#include "utils/string_builder.hpp"

namespace teller {
  namespace validation {

    std::string reasonToString(ValidationReason reason) {
      switch (reason) {
        case ValidationReason::kBadFormat:
          return "BadFormat";
        case ValidationReason::kNonPositive:
          return "NonPositive";
        case ValidationReason::kTooLarge:
          return "TooLarge";
        case ValidationReason::kPinNotUnique:
          return "PinNotUnique";
        case ValidationReason::kSelfTransfer:
          return "SelfTransfer";
        case ValidationReason::kNotConfirmed:
          return "NotConfirmed";
      }
      return "Unknown";
    }

    ValidationError::ValidationError(ReasonName name,
                                     ValidationReason reason,
                                     std::vector<ReasonType> errors)
        : name(std::move(name)), reason(reason), my_errors(std::move(errors)) {}

    std::string ValidationError::toString() const {
      return detail::PrettyStringBuilder()
          .init(name)
          .appendNamed("Reason", reasonToString(reason))
          .appendNamed("Errors", my_errors)
          .finalize();
    }

  }  // namespace validation
}  // namespace teller
