/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_RESULT_FWD_HPP
#define TELLER_RESULT_FWD_HPP

namespace teller {
  namespace expected {

    struct ValueBase;

    template <typename T>
    struct Value;

    struct ErrorBase;

    template <typename E>
    struct Error;

    class ResultException;

    struct ResultBase;

    template <typename V, typename E>
    class Result;

  }  // namespace expected
}  // namespace teller

#endif  // TELLER_RESULT_FWD_HPP
