/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_PIN_HASHER_HPP
#define TELLER_PIN_HASHER_HPP

#include <string>
#include <string_view>

#include "common/result.hpp"
#include "common_objects/types.hpp"

namespace teller {
  namespace crypto {

    /**
     * Produces the stored digest of a PIN: lowercase hex SHA-256 of the PIN
     * text.
     */
    class PinHasher {
     public:
      expected::Result<model::types::PinHashType, std::string> hash(
          std::string_view pin) const;
    };

  }  // namespace crypto
}  // namespace teller

#endif  // TELLER_PIN_HASHER_HPP
