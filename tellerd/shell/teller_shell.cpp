/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "shell/teller_shell.hpp"

#include <istream>
#include <ostream>

#include <fmt/core.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include "logger/logger.hpp"

using teller::service::ServiceError;
using teller::shell::TellerShell;

namespace {
  const std::string kGoodbye = "Thank you for using ATM!\n";

  bool isAmountError(const ServiceError &error) {
    return error.kind == ServiceError::Kind::kValidation
        and (error.reason == ServiceError::Reason::kBadFormat
             or error.reason == ServiceError::Reason::kNonPositive
             or error.reason == ServiceError::Reason::kTooLarge);
  }

  bool isWrongPin(const ServiceError &error) {
    return (error.kind == ServiceError::Kind::kAuth
            and error.reason == ServiceError::Reason::kBadPin)
        or (error.kind == ServiceError::Kind::kValidation
            and error.reason == ServiceError::Reason::kBadFormat);
  }

  /// Entered amounts are echoed with two decimals.
  std::string normalizeAmount(const std::string &amount) {
    return teller::model::Amount(amount)
        .rescaled(teller::model::kMoneyPrecision)
        .toStringRepr();
  }
}  // namespace

TellerShell::TellerShell(std::shared_ptr<service::AccountService> service,
                         size_t max_pin_attempts,
                         std::istream &in,
                         std::ostream &out,
                         logger::LoggerPtr log)
    : service_(std::move(service)),
      max_pin_attempts_(max_pin_attempts),
      in_(in),
      out_(out),
      log_(std::move(log)) {}

void TellerShell::run() {
  while (true) {
    auto status = login();
    if (status == LoginStatus::kEnd) {
      out_ << kGoodbye;
      return;
    }
    if (status == LoginStatus::kLoggedIn) {
      break;
    }
  }

  while (session_) {
    showMenu();
    auto choice = readLine("Choose (1-8): ");
    if (not choice or not handleChoice(*choice)) {
      break;
    }
  }
  log_->info("session closed");
  session_.reset();
}

TellerShell::LoginStatus TellerShell::login() {
  out_ << "\n--- Login ---\n";
  auto account_number = readLine("Enter account number: ");
  if (not account_number) {
    return LoginStatus::kEnd;
  }

  for (size_t attempt = 1; attempt <= max_pin_attempts_; ++attempt) {
    auto pin = readLine("Enter 4-digit PIN: ");
    if (not pin) {
      return LoginStatus::kEnd;
    }

    auto result = service_->authenticate(*account_number, *pin);
    auto error = expected::resultToOptionalError(result);
    if (not error) {
      session_ = std::move(result).assumeValue();
      out_ << "Login successful!\n";
      return LoginStatus::kLoggedIn;
    }

    if (error->kind == ServiceError::Kind::kAuth
        and error->reason == ServiceError::Reason::kBadPin) {
      out_ << fmt::format("Incorrect PIN. {} attempts left.\n",
                          max_pin_attempts_ - attempt);
      continue;
    }
    printError(*error);
    if (not isWrongPin(*error)) {
      return LoginStatus::kRetry;
    }
  }

  log_->warn("too many PIN attempts for account {}", *account_number);
  out_ << "Too many attempts.\n";
  return LoginStatus::kEnd;
}

bool TellerShell::handleChoice(const std::string &choice) {
  if (choice == "1") {
    handleCheckBalance();
  } else if (choice == "2") {
    handleDeposit();
  } else if (choice == "3") {
    handleWithdraw();
  } else if (choice == "4") {
    handleTransfer();
  } else if (choice == "5") {
    handleChangePin();
  } else if (choice == "6") {
    handleHistory();
  } else if (choice == "7") {
    return not handleDelete();
  } else if (choice == "8") {
    out_ << kGoodbye;
    return false;
  } else {
    out_ << "Invalid option.\n";
  }
  return true;
}

void TellerShell::showMenu() {
  out_ << "\n--- ATM Menu ---\n"
       << "1. Check Balance\n"
       << "2. Deposit Funds\n"
       << "3. Withdraw Funds\n"
       << "4. Transfer Funds\n"
       << "5. Change PIN\n"
       << "6. View Transactions\n"
       << "7. Delete Account\n"
       << "8. Exit\n";
}

void TellerShell::handleCheckBalance() {
  auto result = service_->checkBalance(*session_);
  if (auto e = expected::resultToOptionalError(result)) {
    printError(*e);
    return;
  }
  out_ << fmt::format("Current balance: {}\n",
                      result.assumeValue().toStringRepr());
}

void TellerShell::handleDeposit() {
  while (auto amount =
             readLine("Enter amount to deposit (or press Enter to cancel): ")) {
    if (amount->empty()) {
      out_ << "Deposit cancelled.\n";
      return;
    }
    auto result = service_->deposit(*session_, *amount);
    if (auto e = expected::resultToOptionalError(result)) {
      printError(*e);
      if (isAmountError(*e)) {
        continue;
      }
      return;
    }
    session_ = std::move(result).assumeValue();
    out_ << fmt::format("Deposited {}. Current balance: {}\n",
                        normalizeAmount(*amount),
                        session_->balance().toStringRepr());
    return;
  }
}

void TellerShell::handleWithdraw() {
  while (auto amount = readLine(
             "Enter amount to withdraw (or press Enter to cancel): ")) {
    if (amount->empty()) {
      out_ << "Withdrawal cancelled.\n";
      return;
    }
    auto result = service_->withdraw(*session_, *amount);
    if (auto e = expected::resultToOptionalError(result)) {
      printError(*e);
      if (isAmountError(*e)) {
        continue;
      }
      return;
    }
    session_ = std::move(result).assumeValue();
    out_ << fmt::format("Withdrawn {}. Current balance: {}\n",
                        normalizeAmount(*amount),
                        session_->balance().toStringRepr());
    return;
  }
}

void TellerShell::handleTransfer() {
  auto target = readLine(
      "Enter target account number (or press Enter to cancel): ");
  if (not target) {
    return;
  }
  if (target->empty()) {
    out_ << "Transfer cancelled.\n";
    return;
  }

  while (auto amount = readLine(
             "Enter amount to transfer (or press Enter to cancel): ")) {
    if (amount->empty()) {
      out_ << "Transfer cancelled.\n";
      return;
    }
    auto result = service_->transfer(*session_, *target, *amount);
    if (auto e = expected::resultToOptionalError(result)) {
      printError(*e);
      if (isAmountError(*e)) {
        continue;
      }
      return;
    }
    session_ = std::move(result).assumeValue().source;
    out_ << fmt::format("Transferred {} to account {}.\n",
                        normalizeAmount(*amount),
                        *target);
    return;
  }
}

void TellerShell::handleChangePin() {
  for (size_t attempt = 1; attempt <= max_pin_attempts_; ++attempt) {
    auto current_pin =
        readLine("Enter current 4-digit PIN (or press Enter to cancel): ");
    if (not current_pin) {
      return;
    }
    if (current_pin->empty()) {
      out_ << "PIN change cancelled.\n";
      return;
    }

    auto verified =
        service_->authenticate(session_->accountNumber(), *current_pin);
    if (auto e = expected::resultToOptionalError(verified)) {
      if (isWrongPin(*e)) {
        out_ << fmt::format("Incorrect PIN. {} attempts left.\n",
                            max_pin_attempts_ - attempt);
        continue;
      }
      printError(*e);
      return;
    }

    auto new_pin = readLine("Enter new 4-digit PIN: ");
    if (not new_pin) {
      return;
    }
    auto confirm_pin = readLine("Confirm new PIN: ");
    if (not confirm_pin) {
      return;
    }
    if (*new_pin != *confirm_pin) {
      out_ << "PINs do not match.\n";
      return;
    }

    auto result = service_->changePin(*session_, *new_pin);
    if (auto e = expected::resultToOptionalError(result)) {
      printError(*e);
      return;
    }
    session_ = std::move(result).assumeValue();
    out_ << "PIN changed successfully.\n";
    return;
  }
  out_ << "Too many attempts.\n";
}

void TellerShell::handleHistory() {
  auto result = service_->transactionHistory(*session_);
  if (auto e = expected::resultToOptionalError(result)) {
    printError(*e);
    return;
  }

  out_ << "\n--- Transaction History ---\n";
  const auto &history = result.assumeValue();
  if (history.empty()) {
    out_ << "No transactions found.\n";
    return;
  }
  for (const auto &record : history) {
    out_ << fmt::format(
        "{} | {} | {} | {} | {}\n",
        record.timestamp(),
        model::transactionTypeToString(record.type()),
        record.amount().toStringRepr(),
        record.counterpartyAccount().value_or("-"),
        model::transactionDirectionToString(record.direction()));
  }
}

bool TellerShell::handleDelete() {
  auto answer =
      readLine("Are you sure you want to delete your account? (yes/no): ");
  if (not answer) {
    return false;
  }

  auto confirmed = boost::algorithm::to_lower_copy(*answer) == "yes";
  auto result = service_->softDelete(*session_, confirmed);
  if (auto e = expected::resultToOptionalError(result)) {
    if (e->reason == ServiceError::Reason::kNotConfirmed) {
      out_ << "Account deletion cancelled.\n";
    } else {
      printError(*e);
    }
    return false;
  }

  out_ << "Account deleted successfully.\n" << kGoodbye;
  return true;
}

std::optional<std::string> TellerShell::readLine(const std::string &prompt) {
  out_ << prompt << std::flush;
  std::string line;
  if (not std::getline(in_, line)) {
    out_ << "\n";
    return std::nullopt;
  }
  boost::algorithm::trim(line);
  return line;
}

void TellerShell::printError(const ServiceError &error) {
  if (error.kind == ServiceError::Kind::kStorage) {
    out_ << fmt::format("Operation failed: {}\n", error.message);
    return;
  }
  out_ << error.message << "\n";
}
