/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_RESULT_TRY_HPP
#define TELLER_RESULT_TRY_HPP

#include "common/result.hpp"

#define TELLER_EXPECTED_ERROR_CHECK(...)                             \
  if (auto _tmp_gen_var = (__VA_ARGS__);                             \
      teller::expected::hasError(_tmp_gen_var))                      \
  return teller::expected::makeError(std::move(_tmp_gen_var).assumeError())

#define TELLER_EXPECTED_TRY_GET_VALUE(name, ...)                    \
  auto _tmp_gen_var_##name = (__VA_ARGS__);                         \
  if (teller::expected::hasError(_tmp_gen_var_##name)) {            \
    return teller::expected::makeError(                             \
        std::move(_tmp_gen_var_##name).assumeError());              \
  }                                                                 \
  auto name = std::move(_tmp_gen_var_##name).assumeValue()

#endif  // TELLER_RESULT_TRY_HPP
