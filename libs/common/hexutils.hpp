/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
#ifndef TELLER_HEXUTILS_HPP
#define TELLER_HEXUTILS_HPP

#include <cstdint>
#include <iterator>
#include <string>

#include <boost/algorithm/hex.hpp>

namespace teller {

  /**
   * Convert a range of raw bytes to printable lowercase hex string
   * @param begin - first byte
   * @param end - one past the last byte
   * @return - converted hex string
   */
  inline std::string bytesToHexstring(const uint8_t *begin,
                                      const uint8_t *end) {
    std::string result;
    result.reserve((end - begin) * 2);
    boost::algorithm::hex_lower(begin, end, std::back_inserter(result));
    return result;
  }

}  // namespace teller

#endif  // TELLER_HEXUTILS_HPP
