/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_STORAGE_ERROR_HPP
#define TELLER_STORAGE_ERROR_HPP

#include <string>

#include <fmt/core.h>
#include "common/result.hpp"

namespace teller {
  namespace storage {

    /**
     * A failure to read, parse or write one of the tables
     */
    struct StorageError {
      std::string path;     ///< the table file involved
      std::string message;  ///< what went wrong

      std::string toString() const {
        return fmt::format("{}: {}", path, message);
      }
    };

    template <typename T>
    using StorageResult = expected::Result<T, StorageError>;

  }  // namespace storage
}  // namespace teller

#endif  // TELLER_STORAGE_ERROR_HPP
