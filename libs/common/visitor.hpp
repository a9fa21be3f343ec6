/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_VISITOR_HPP
#define KMSIGN_VISITOR_HPP

#include <utility>

#include <boost/variant/apply_visitor.hpp>

namespace kmsign {

  /// Overload set built from several lambdas
  template <typename... Lambdas>
  struct LambdaVisitor : Lambdas... {
    using Lambdas::operator()...;
  };

  template <typename... Lambdas>
  LambdaVisitor(Lambdas...)->LambdaVisitor<Lambdas...>;

  /**
   * Convenient in-place compile-time visitor creation, from a set of lambdas
   *
   * @code
   * make_visitor([](int a) { return 1; },
   *              [](std::string b) { return 2; });
   * @nocode
   * is essentially the same as
   *
   * @code
   * struct visitor : public boost::static_visitor<int> {
   *   int operator()(int a) { return 1; }
   *   int operator()(std::string b) { return 2; }
   * }
   * @nocode
   */
  template <typename... Lambdas>
  constexpr auto make_visitor(Lambdas &&... lambdas) {
    return LambdaVisitor<std::decay_t<Lambdas>...>{
        std::forward<Lambdas>(lambdas)...};
  }

  /**
   * Apply the lambdas as a visitor to the given boost::variant
   * @param variant to visit
   * @param lambdas one lambda per alternative
   * @return whatever the matched lambda returns
   */
  template <typename TVariant, typename... TVisitors>
  constexpr decltype(auto) visit_in_place(TVariant &&variant,
                                          TVisitors &&... visitors) {
    return boost::apply_visitor(
        make_visitor(std::forward<TVisitors>(visitors)...),
        std::forward<TVariant>(variant));
  }

}  // namespace kmsign

#endif  // KMSIGN_VISITOR_HPP
