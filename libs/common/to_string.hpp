/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_LIBS_TO_STRING_HPP
#define TELLER_LIBS_TO_STRING_HPP

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace teller {
  namespace to_string {
    namespace detail {
      const std::string kBeginBlockMarker = "[";
      const std::string kEndBlockMarker = "]";
      const std::string kSingleFieldsSeparator = ", ";
      const std::string kNotSet = "(not set)";
    }  // namespace detail

    inline std::string toString(std::string const &o) {
      return o;
    }

    inline std::string toString(std::string_view o) {
      return std::string{o};
    }

    inline std::string toString(const char *o) {
      return std::string{o};
    }

    inline std::string toString(bool o) {
      return o ? "true" : "false";
    }

    template <typename T>
    inline auto toString(const T &o) -> std::enable_if_t<
        std::is_same<decltype(std::to_string(o)), std::string>::value
            and not std::is_same<T, bool>::value,
        std::string> {
      return std::to_string(o);
    }

    template <typename T>
    inline auto toString(const T &o) -> std::enable_if_t<
        std::is_same<typename std::decay_t<decltype(o.toString())>,
                     std::string>::value,
        std::string> {
      return o.toString();
    }

    template <typename T>
    inline std::string toString(const std::optional<T> &o) {
      if (o) {
        return ::teller::to_string::toString(*o);
      }
      return detail::kNotSet;
    }

    /// Print a plain collection.
    template <typename T, typename = decltype(*std::declval<T>().begin())>
    inline auto toString(const T &c) -> std::enable_if_t<
        not std::is_convertible<T, std::string_view>::value,
        std::string> {
      std::string result = detail::kBeginBlockMarker;
      bool need_field_separator = false;
      for (auto &o : c) {
        if (need_field_separator) {
          result.append(detail::kSingleFieldsSeparator);
        }
        result.append(toString(o));
        need_field_separator = true;
      }
      result.append(detail::kEndBlockMarker);
      return result;
    }

  }  // namespace to_string
}  // namespace teller

#endif  // TELLER_LIBS_TO_STRING_HPP
