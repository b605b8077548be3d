/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_ACCOUNT_SERVICE_IMPL_HPP
#define TELLER_ACCOUNT_SERVICE_IMPL_HPP

#include "service/account_service.hpp"

#include <functional>
#include <memory>

#include "cryptography/pin_hasher.hpp"
#include "logger/logger_fwd.hpp"
#include "storage/record_store.hpp"
#include "validators/field_validator.hpp"

namespace teller {
  namespace service {

    /// @return current local time as YYYY-MM-DD HH:MM:SS
    model::types::TimestampType currentLocalTime();

    class AccountServiceImpl : public AccountService {
     public:
      using TimeFunction = std::function<model::types::TimestampType()>;

      /**
       * @param store - the tables
       * @param log - logger
       * @param time_provider - the timestamp source of the log records
       */
      AccountServiceImpl(std::shared_ptr<storage::RecordStore> store,
                         logger::LoggerPtr log,
                         TimeFunction time_provider = currentLocalTime);

      ServiceResult<model::Account> authenticate(
          const std::string &account_number, const std::string &pin) override;

      ServiceResult<model::Amount> checkBalance(
          const model::Account &account) const override;

      ServiceResult<model::Account> deposit(const model::Account &account,
                                            const std::string &amount) override;

      ServiceResult<model::Account> withdraw(
          const model::Account &account, const std::string &amount) override;

      ServiceResult<TransferOutcome> transfer(
          const model::Account &account,
          const std::string &target_account_number,
          const std::string &amount) override;

      ServiceResult<model::Account> changePin(
          const model::Account &account, const std::string &new_pin) override;

      ServiceResult<model::Account> softDelete(const model::Account &account,
                                               bool confirmed) override;

      ServiceResult<std::vector<model::TransactionRecord>> transactionHistory(
          const model::Account &account) const override;

     private:
      /// Freshly loaded accounts table and the position of the session row
      struct Snapshot {
        std::vector<model::Account> accounts;
        size_t session_index;
      };

      /**
       * Reload the accounts and find the session account among the active
       * ones.
       */
      ServiceResult<Snapshot> loadSession(const model::Account &account) const;

      /**
       * Persist the updated accounts, then append the records in order. If
       * the first record cannot be appended, the previous accounts are
       * written back.
       */
      ServiceResult<void> commit(
          const std::vector<model::Account> &previous,
          const std::vector<model::Account> &updated,
          const std::vector<model::TransactionRecord> &records);

      ServiceResult<model::Amount> parseAmount(const std::string &amount) const;

      ServiceResult<model::types::PinHashType> hashPin(
          const std::string &pin) const;

      std::shared_ptr<storage::RecordStore> store_;
      crypto::PinHasher pin_hasher_;
      validation::FieldValidator field_validator_;
      TimeFunction time_provider_;
      logger::LoggerPtr log_;
    };

  }  // namespace service
}  // namespace teller

#endif  // TELLER_ACCOUNT_SERVICE_IMPL_HPP
