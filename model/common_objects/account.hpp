/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_MODEL_ACCOUNT_HPP
#define TELLER_MODEL_ACCOUNT_HPP

#include "common_objects/amount.hpp"
#include "common_objects/types.hpp"

namespace teller {
  namespace model {

    /**
     * One row of the accounts table
     */
    class Account final {
     public:
      Account(types::AccountNumberType account_number,
              types::AccountNameType name,
              types::PinHashType pin_hash,
              types::AddressType address,
              Amount balance,
              bool is_deleted);

      /// @return unique nine digit account number
      const types::AccountNumberType &accountNumber() const;

      const types::AccountNameType &name() const;

      /// @return hex digest of the PIN
      const types::PinHashType &pinHash() const;

      const types::AddressType &address() const;

      const Amount &balance() const;

      bool isDeleted() const;

      void setBalance(Amount balance);

      void setPinHash(types::PinHashType pin_hash);

      void setDeleted(bool is_deleted);

      bool operator==(const Account &rhs) const;

      bool operator!=(const Account &rhs) const;

      /// The PIN digest is not a part of the description.
      std::string toString() const;

     private:
      types::AccountNumberType account_number_;
      types::AccountNameType name_;
      types::PinHashType pin_hash_;
      types::AddressType address_;
      Amount balance_;
      bool is_deleted_;
    };

  }  // namespace model
}  // namespace teller

#endif  // TELLER_MODEL_ACCOUNT_HPP
