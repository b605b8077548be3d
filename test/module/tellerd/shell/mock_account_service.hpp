/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_MOCK_ACCOUNT_SERVICE_HPP
#define TELLER_MOCK_ACCOUNT_SERVICE_HPP

#include "service/account_service.hpp"

#include <gmock/gmock.h>

namespace teller {
  namespace service {

    class MockAccountService : public AccountService {
     public:
      MOCK_METHOD(ServiceResult<model::Account>,
                  authenticate,
                  (const std::string &, const std::string &),
                  (override));
      MOCK_METHOD(ServiceResult<model::Amount>,
                  checkBalance,
                  (const model::Account &),
                  (const, override));
      MOCK_METHOD(ServiceResult<model::Account>,
                  deposit,
                  (const model::Account &, const std::string &),
                  (override));
      MOCK_METHOD(ServiceResult<model::Account>,
                  withdraw,
                  (const model::Account &, const std::string &),
                  (override));
      MOCK_METHOD(ServiceResult<TransferOutcome>,
                  transfer,
                  (const model::Account &,
                   const std::string &,
                   const std::string &),
                  (override));
      MOCK_METHOD(ServiceResult<model::Account>,
                  changePin,
                  (const model::Account &, const std::string &),
                  (override));
      MOCK_METHOD(ServiceResult<model::Account>,
                  softDelete,
                  (const model::Account &, bool),
                  (override));
      MOCK_METHOD(ServiceResult<std::vector<model::TransactionRecord>>,
                  transactionHistory,
                  (const model::Account &),
                  (const, override));
    };

  }  // namespace service
}  // namespace teller

#endif  // TELLER_MOCK_ACCOUNT_SERVICE_HPP
