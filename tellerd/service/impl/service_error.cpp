/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "service/service_error.hpp"

#include <boost/algorithm/string/join.hpp>
#include "storage/storage_error.hpp"
#include "utils/string_builder.hpp"
#include "validators/validation_error.hpp"

namespace {
  using teller::service::ServiceError;
  using teller::validation::ValidationReason;

  ServiceError::Reason toServiceReason(ValidationReason reason) {
    switch (reason) {
      case ValidationReason::kBadFormat:
        return ServiceError::Reason::kBadFormat;
      case ValidationReason::kNonPositive:
        return ServiceError::Reason::kNonPositive;
      case ValidationReason::kTooLarge:
        return ServiceError::Reason::kTooLarge;
      case ValidationReason::kPinNotUnique:
        return ServiceError::Reason::kPinNotUnique;
      case ValidationReason::kSelfTransfer:
        return ServiceError::Reason::kSelfTransfer;
      case ValidationReason::kNotConfirmed:
        return ServiceError::Reason::kNotConfirmed;
    }
    return ServiceError::Reason::kNone;
  }
}  // namespace

namespace teller {
  namespace service {

    ServiceError ServiceError::fromStorage(
        const storage::StorageError &error) {
      return ServiceError{Kind::kStorage, Reason::kNone, error.toString()};
    }

    ServiceError ServiceError::fromValidation(
        const validation::ValidationError &error) {
      return ServiceError{Kind::kValidation,
                          toServiceReason(error.reason),
                          boost::algorithm::join(error.my_errors, " ")};
    }

    ServiceError ServiceError::auth(Reason reason, std::string message) {
      return ServiceError{Kind::kAuth, reason, std::move(message)};
    }

    ServiceError ServiceError::accountNotFound(std::string message) {
      return ServiceError{
          Kind::kAccountNotFound, Reason::kNone, std::move(message)};
    }

    ServiceError ServiceError::insufficientFunds(std::string message) {
      return ServiceError{
          Kind::kInsufficientFunds, Reason::kNone, std::move(message)};
    }

    std::string ServiceError::toString() const {
      return detail::PrettyStringBuilder()
          .init("ServiceError")
          .appendNamed("kind", kindToString(kind))
          .appendNamed("reason", reasonToString(reason))
          .appendNamed("message", message)
          .finalize();
    }

    std::string kindToString(ServiceError::Kind kind) {
      switch (kind) {
        case ServiceError::Kind::kStorage:
          return "StorageError";
        case ServiceError::Kind::kValidation:
          return "ValidationError";
        case ServiceError::Kind::kAuth:
          return "AuthError";
        case ServiceError::Kind::kAccountNotFound:
          return "AccountNotFoundError";
        case ServiceError::Kind::kInsufficientFunds:
          return "InsufficientFundsError";
      }
      return "UnknownError";
    }

    std::string reasonToString(ServiceError::Reason reason) {
      switch (reason) {
        case ServiceError::Reason::kNone:
          return "None";
        case ServiceError::Reason::kBadFormat:
          return "BadFormat";
        case ServiceError::Reason::kNonPositive:
          return "NonPositive";
        case ServiceError::Reason::kTooLarge:
          return "TooLarge";
        case ServiceError::Reason::kPinNotUnique:
          return "PinNotUnique";
        case ServiceError::Reason::kSelfTransfer:
          return "SelfTransfer";
        case ServiceError::Reason::kNotConfirmed:
          return "NotConfirmed";
        case ServiceError::Reason::kNotFound:
          return "NotFound";
        case ServiceError::Reason::kBadPin:
          return "BadPin";
      }
      return "Unknown";
    }

  }  // namespace service
}  // namespace teller
