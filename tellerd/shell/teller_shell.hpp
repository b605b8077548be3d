/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_TELLER_SHELL_HPP
#define TELLER_TELLER_SHELL_HPP

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "common_objects/account.hpp"
#include "logger/logger_fwd.hpp"
#include "service/account_service.hpp"

namespace teller {
  namespace shell {

    /**
     * Text menu of the teller bound to one session. Reads the user input
     * line by line and never stops on a service error: the error is
     * printed and the menu is shown again.
     */
    class TellerShell {
     public:
      static constexpr size_t kDefaultMaxPinAttempts = 3;

      /**
       * @param service - business operations
       * @param max_pin_attempts - wrong PIN entries allowed per login
       * @param in - user input
       * @param out - user output
       * @param log - logger
       */
      TellerShell(std::shared_ptr<service::AccountService> service,
                  size_t max_pin_attempts,
                  std::istream &in,
                  std::ostream &out,
                  logger::LoggerPtr log);

      /**
       * Log in and serve the menu until the user exits, deletes the
       * account, runs out of PIN attempts or the input ends.
       */
      void run();

     private:
      enum class LoginStatus { kLoggedIn, kRetry, kEnd };

      LoginStatus login();

      /// @return false when the session is over
      bool handleChoice(const std::string &choice);

      void showMenu();
      void handleCheckBalance();
      void handleDeposit();
      void handleWithdraw();
      void handleTransfer();
      void handleChangePin();
      void handleHistory();
      /// @return true if the account has been deleted
      bool handleDelete();

      /**
       * Read one trimmed line.
       * @return none at the end of the input
       */
      std::optional<std::string> readLine(const std::string &prompt);

      void printError(const service::ServiceError &error);

      std::shared_ptr<service::AccountService> service_;
      size_t max_pin_attempts_;
      std::istream &in_;
      std::ostream &out_;
      logger::LoggerPtr log_;
      std::optional<model::Account> session_;
    };

  }  // namespace shell
}  // namespace teller

#endif  // TELLER_TELLER_SHELL_HPP
