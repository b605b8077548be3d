/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common_objects/account.hpp"

#include "utils/string_builder.hpp"

namespace teller {
  namespace model {

    Account::Account(types::AccountNumberType account_number,
                     types::AccountNameType name,
                     types::PinHashType pin_hash,
                     types::AddressType address,
                     Amount balance,
                     bool is_deleted)
        : account_number_(std::move(account_number)),
          name_(std::move(name)),
          pin_hash_(std::move(pin_hash)),
          address_(std::move(address)),
          balance_(std::move(balance)),
          is_deleted_(is_deleted) {}

    const types::AccountNumberType &Account::accountNumber() const {
      return account_number_;
    }

    const types::AccountNameType &Account::name() const {
      return name_;
    }

    const types::PinHashType &Account::pinHash() const {
      return pin_hash_;
    }

    const types::AddressType &Account::address() const {
      return address_;
    }

    const Amount &Account::balance() const {
      return balance_;
    }

    bool Account::isDeleted() const {
      return is_deleted_;
    }

    void Account::setBalance(Amount balance) {
      balance_ = std::move(balance);
    }

    void Account::setPinHash(types::PinHashType pin_hash) {
      pin_hash_ = std::move(pin_hash);
    }

    void Account::setDeleted(bool is_deleted) {
      is_deleted_ = is_deleted;
    }

    bool Account::operator==(const Account &rhs) const {
      return account_number_ == rhs.account_number_ and name_ == rhs.name_
          and pin_hash_ == rhs.pin_hash_ and address_ == rhs.address_
          and balance_ == rhs.balance_ and is_deleted_ == rhs.is_deleted_;
    }

    bool Account::operator!=(const Account &rhs) const {
      return not(*this == rhs);
    }

    std::string Account::toString() const {
      return detail::PrettyStringBuilder()
          .init("Account")
          .appendNamed("number", account_number_)
          .appendNamed("name", name_)
          .appendNamed("address", address_)
          .appendNamed("balance", balance_.toStringRepr())
          .appendNamed("deleted", is_deleted_)
          .finalize();
    }

  }  // namespace model
}  // namespace teller
