/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef TELLER_VISITOR_HPP
#define TELLER_VISITOR_HPP

#include <type_traits>
#include <utility>

#include <boost/variant/apply_visitor.hpp>

namespace teller {

  /// A visitor built from a set of lambdas, one per visited alternative.
  template <typename... Lambdas>
  struct LambdaVisitor : Lambdas... {
    using Lambdas::operator()...;
  };

  template <typename... Lambdas>
  LambdaVisitor(Lambdas...)->LambdaVisitor<Lambdas...>;

  template <typename... Lambdas>
  constexpr auto make_visitor(Lambdas &&... lambdas) {
    return LambdaVisitor<std::decay_t<Lambdas>...>{
        std::forward<Lambdas>(lambdas)...};
  }

  /**
   * Apply the lambdas to a boost::variant in place. Example:
   * @code
   * boost::variant<int, std::string> v;
   * visit_in_place(v,
   *                [](int) { std::cout << "int"; },
   *                [](std::string) { std::cout << "string"; });
   * @endcode
   */
  template <typename TVariant, typename... TVisitors>
  constexpr decltype(auto) visit_in_place(TVariant &&variant,
                                          TVisitors &&... visitors) {
    return boost::apply_visitor(
        make_visitor(std::forward<TVisitors>(visitors)...),
        std::forward<TVariant>(variant));
  }

}  // namespace teller

#endif  // TELLER_VISITOR_HPP
