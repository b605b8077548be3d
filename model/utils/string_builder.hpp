/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_MODEL_STRING_BUILDER_HPP
#define TELLER_MODEL_STRING_BUILDER_HPP

#include <string>

#include "common/to_string.hpp"

namespace teller {
  namespace detail {
    /**
     * Builds log-friendly object descriptions like
     * "Account: [number=123456789, name=Ahmed]"
     */
    class PrettyStringBuilder {
     public:
      /**
       * Initializes new string with a provided name
       * @param name - name to initialize
       */
      PrettyStringBuilder &init(const std::string &name);

      PrettyStringBuilder &append(const std::string &o);

      template <typename T>
      PrettyStringBuilder &append(const T &o) {
        return append(teller::to_string::toString(o));
      }

      /**
       * Appends new field to string as a "name=value" pair
       * @param name - field name to append
       * @param value - field value
       */
      template <typename Value>
      PrettyStringBuilder &appendNamed(const std::string &name,
                                       const Value &value) {
        appendPartial(name);
        appendPartial(kKeyValueSeparator);
        return append(teller::to_string::toString(value));
      }

      /// @return constructed string
      std::string finalize();

     private:
      void appendPartial(const std::string &value);

      std::string result_;
      bool need_field_separator_ = false;

      static const std::string kKeyValueSeparator;
    };
  }  // namespace detail
}  // namespace teller

#endif  // TELLER_MODEL_STRING_BUILDER_HPP
