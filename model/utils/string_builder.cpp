/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/string_builder.hpp"

namespace {
  const std::string kBeginBlockMarker = "[";
  const std::string kEndBlockMarker = "]";
  const std::string kSingleFieldsSeparator = ", ";
  const std::string kInitSeparator = ": ";
}  // namespace

namespace teller {
  namespace detail {

    const std::string PrettyStringBuilder::kKeyValueSeparator = "=";

    PrettyStringBuilder &PrettyStringBuilder::init(const std::string &name) {
      result_.append(name);
      result_.append(kInitSeparator);
      result_.append(kBeginBlockMarker);
      need_field_separator_ = false;
      return *this;
    }

    PrettyStringBuilder &PrettyStringBuilder::append(const std::string &o) {
      appendPartial(o);
      need_field_separator_ = true;
      return *this;
    }

    std::string PrettyStringBuilder::finalize() {
      result_.append(kEndBlockMarker);
      need_field_separator_ = true;
      return result_;
    }

    void PrettyStringBuilder::appendPartial(const std::string &value) {
      if (need_field_separator_) {
        result_.append(kSingleFieldsSeparator);
        need_field_separator_ = false;
      }
      result_.append(value);
    }

  }  // namespace detail
}  // namespace teller
