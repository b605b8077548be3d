/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_SERVICE_ERROR_HPP
#define TELLER_SERVICE_ERROR_HPP

#include <string>

namespace teller {
  namespace storage {
    struct StorageError;
  }
  namespace validation {
    struct ValidationError;
  }

  namespace service {

    /**
     * Error of an account operation. Every kind is recoverable: the
     * session goes on after it is reported.
     */
    struct ServiceError {
      enum class Kind {
        kStorage,
        kValidation,
        kAuth,
        kAccountNotFound,
        kInsufficientFunds,
      };

      /// Refines kValidation and kAuth errors, kNone for the other kinds
      enum class Reason {
        kNone,
        kBadFormat,
        kNonPositive,
        kTooLarge,
        kPinNotUnique,
        kSelfTransfer,
        kNotConfirmed,
        kNotFound,
        kBadPin,
      };

      static ServiceError fromStorage(const storage::StorageError &error);

      static ServiceError fromValidation(
          const validation::ValidationError &error);

      static ServiceError auth(Reason reason, std::string message);

      static ServiceError accountNotFound(std::string message);

      static ServiceError insufficientFunds(std::string message);

      std::string toString() const;

      Kind kind;
      Reason reason;
      std::string message;
    };

    std::string kindToString(ServiceError::Kind kind);

    std::string reasonToString(ServiceError::Reason reason);

  }  // namespace service
}  // namespace teller

#endif  // TELLER_SERVICE_ERROR_HPP
