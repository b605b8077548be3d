/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_RESULT_HPP
#define TELLER_RESULT_HPP

#include "common/result_fwd.hpp"

#include <ciso646>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "common/visitor.hpp"

/*
 * Result is a type which represents value or an error, and values and errors
 * are template parametrized. Working with value wrapped in result is done using
 * match() function, which accepts 2 functions: for value and error cases, or
 * with the hasValue()/hasError() checkers followed by assumeValue() or
 * assumeError().
 */

namespace teller {
  namespace expected {

    struct ValueBase {};

    template <typename T>
    struct Value : ValueBase {
      using type = T;
      template <
          typename... Args,
          typename = std::enable_if_t<std::is_constructible<T, Args...>::value>>
      Value(Args &&... args) : value(std::forward<Args>(args)...) {}
      T value;
    };

    template <>
    struct Value<void> : ValueBase {};

    struct ErrorBase {};

    template <typename E>
    struct Error : ErrorBase {
      using type = E;
      template <
          typename... Args,
          typename = std::enable_if_t<std::is_constructible<E, Args...>::value>>
      Error(Args &&... args) : error(std::forward<Args>(args)...) {}
      E error;
    };

    template <>
    struct Error<void> : ErrorBase {};

    class ResultException : public std::runtime_error {
      using std::runtime_error::runtime_error;
    };

    struct ResultBase {};

    /**
     * Result is a specialization of a variant type with value or error
     * semantics.
     * @tparam V type of value
     * @tparam E error type
     */
    template <typename V, typename E = std::string>
    class Result : ResultBase, public boost::variant<Value<V>, Error<E>> {
      using variant_type = boost::variant<Value<V>, Error<E>>;
      using variant_type::variant_type;  // inherit constructors

     public:
      using ValueType = Value<V>;
      using ErrorType = Error<E>;

      using ValueInnerType = V;
      using ErrorInnerType = E;

      /// Only available when the value type is default constructible.
      template <typename T = ValueType,
                typename =
                    std::enable_if_t<std::is_default_constructible<T>::value>>
      Result() {}

      /**
       * match is a function which allows working with result's underlying
       * types, you must provide 2 functions to cover success and failure cases.
       * Return type of both functions must be the same. Example usage:
       * @code
       * result.match([](Value<int> v) { std::cout << v.value; },
       *              [](Error<std::string> e) { std::cout << e.error; });
       * @endcode
       */
      template <typename ValueMatch, typename ErrorMatch>
      constexpr auto match(ValueMatch &&value_func, ErrorMatch &&error_func) & {
        return visit_in_place(*this,
                              [f = std::forward<ValueMatch>(value_func)](
                                  ValueType &v) { return f(v); },
                              [f = std::forward<ErrorMatch>(error_func)](
                                  ErrorType &e) { return f(e); });
      }

      /**
       * Move alternative for match function
       */
      template <typename ValueMatch, typename ErrorMatch>
      constexpr auto match(ValueMatch &&value_func,
                           ErrorMatch &&error_func) && {
        return visit_in_place(*this,
                              [f = std::forward<ValueMatch>(value_func)](
                                  ValueType &v) { return f(std::move(v)); },
                              [f = std::forward<ErrorMatch>(error_func)](
                                  ErrorType &e) { return f(std::move(e)); });
      }

      /**
       * Const alternative for match function
       */
      template <typename ValueMatch, typename ErrorMatch>
      constexpr auto match(ValueMatch &&value_func,
                           ErrorMatch &&error_func) const & {
        return visit_in_place(*this,
                              [f = std::forward<ValueMatch>(value_func)](
                                  const ValueType &v) { return f(v); },
                              [f = std::forward<ErrorMatch>(error_func)](
                                  const ErrorType &e) { return f(e); });
      }

      using AssumeValueHelper =
          std::conditional_t<std::is_void<ValueInnerType>::value,
                             void *,
                             ValueInnerType>;

      /// @return value if present, otherwise throw ResultException
      template <typename ReturnType = const AssumeValueHelper &>
      std::enable_if_t<not std::is_void<ValueInnerType>::value, ReturnType>
      assumeValue() const & {
        const auto *val = boost::get<ValueType>(this);
        if (val != nullptr) {
          return val->value;
        }
        throw ResultException("Value expected, but got an Error.");
      }

      /// @return value if present, otherwise throw ResultException
      template <typename ReturnType = AssumeValueHelper &>
      std::enable_if_t<not std::is_void<ValueInnerType>::value, ReturnType>
      assumeValue() & {
        auto val = boost::get<ValueType>(this);
        if (val != nullptr) {
          return val->value;
        }
        throw ResultException("Value expected, but got an Error.");
      }

      /// @return value if present, otherwise throw ResultException
      template <typename ReturnType = AssumeValueHelper &&>
      std::enable_if_t<not std::is_void<ValueInnerType>::value, ReturnType>
      assumeValue() && {
        auto val = boost::get<ValueType>(this);
        if (val != nullptr) {
          return std::move(val->value);
        }
        throw ResultException("Value expected, but got an Error.");
      }

      using AssumeErrorHelper =
          std::conditional_t<std::is_void<ErrorInnerType>::value,
                             void *,
                             ErrorInnerType>;

      /// @return error if present, otherwise throw ResultException
      template <typename ReturnType = const AssumeErrorHelper &>
      std::enable_if_t<not std::is_void<ErrorInnerType>::value, ReturnType>
      assumeError() const & {
        const auto *err = boost::get<ErrorType>(this);
        if (err != nullptr) {
          return err->error;
        }
        throw ResultException("Error expected, but got a Value.");
      }

      /// @return error if present, otherwise throw ResultException
      template <typename ReturnType = AssumeErrorHelper &>
      std::enable_if_t<not std::is_void<ErrorInnerType>::value, ReturnType>
      assumeError() & {
        auto err = boost::get<ErrorType>(this);
        if (err != nullptr) {
          return err->error;
        }
        throw ResultException("Error expected, but got a Value.");
      }

      /// @return error if present, otherwise throw ResultException
      template <typename ReturnType = AssumeErrorHelper &&>
      std::enable_if_t<not std::is_void<ErrorInnerType>::value, ReturnType>
      assumeError() && {
        auto err = boost::get<ErrorType>(this);
        if (err != nullptr) {
          return std::move(err->error);
        }
        throw ResultException("Error expected, but got a Value.");
      }
    };

    template <typename ResultType>
    using ValueOf = typename std::decay_t<ResultType>::ValueType;
    template <typename ResultType>
    using ErrorOf = typename std::decay_t<ResultType>::ErrorType;

    template <typename ResultType>
    using InnerValueOf = typename std::decay_t<ResultType>::ValueInnerType;
    template <typename ResultType>
    using InnerErrorOf = typename std::decay_t<ResultType>::ErrorInnerType;

    // Factory methods for avoiding type specification
    inline Value<void> makeValue() {
      return Value<void>{};
    }

    template <typename T>
    Value<std::decay_t<T>> makeValue(T &&value) {
      return Value<std::decay_t<T>>{std::forward<T>(value)};
    }

    inline Error<void> makeError() {
      return Error<void>{};
    }

    template <typename E>
    Error<std::decay_t<E>> makeError(E &&error) {
      return Error<std::decay_t<E>>{std::forward<E>(error)};
    }

    template <typename T>
    constexpr bool isResult =
        std::is_base_of<ResultBase, std::decay_t<T>>::value;

    /**
     * Checkers of the Result type.
     */

    template <typename ResultType,
              typename = std::enable_if_t<isResult<ResultType>>>
    bool hasValue(const ResultType &result) {
      return boost::get<ValueOf<ResultType>>(&result);
    }

    template <typename ResultType,
              typename = std::enable_if_t<isResult<ResultType>>>
    bool hasError(const ResultType &result) {
      return boost::get<ErrorOf<ResultType>>(&result);
    }

    /// @return optional with error if present, otherwise none
    template <typename ResultType,
              typename = std::enable_if_t<isResult<ResultType>>>
    boost::optional<InnerErrorOf<ResultType>> resultToOptionalError(
        ResultType &&res) noexcept {
      if (hasError(res)) {
        return boost::get<ErrorOf<ResultType>>(std::forward<ResultType>(res))
            .error;
      }
      return {};
    }

  }  // namespace expected
}  // namespace teller
#endif  // TELLER_RESULT_HPP
