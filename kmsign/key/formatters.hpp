/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KEY_FORMATTERS_HPP
#define KMSIGN_KEY_FORMATTERS_HPP

#include <string_view>
#include <type_traits>
#include <utility>

#include <botan/exceptn.h>
#include <fmt/core.h>
#include "key/kms_error.hpp"
#include "key/signing_algorithm.hpp"

namespace kmsign::detail {
  /// enums of this library named by a free toString(), e.g. SigningAlgorithm
  template <typename T, typename = void>
  struct IsNamedEnum : std::false_type {};

  template <typename T>
  struct IsNamedEnum<
      T,
      std::enable_if_t<std::is_enum_v<T>
                       and std::is_same_v<decltype(kmsign::toString(
                                              std::declval<T>())),
                                          char const *>>> : std::true_type {};
}  // namespace kmsign::detail

namespace fmt {
  /// Prints the service or library name of the value, so that
  /// log.info("{}", algorithm) gives "RSASSA_PSS_SHA_256"
  template <typename T>
  struct formatter<T,
                   std::enable_if_t<kmsign::detail::IsNamedEnum<T>::value,
                                    char>> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(T value, FormatContext &ctx) const -> decltype(ctx.out()) {
      return formatter<std::string_view>::format(kmsign::toString(value), ctx);
    }
  };

  template <>
  struct formatter<Botan::Exception, char> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(Botan::Exception const &val, FormatContext &ctx) const
        -> decltype(ctx.out()) {
      return format_to(ctx.out(), "Botan error: {}", val.what());
    }
  };
}  // namespace fmt

#endif  // KMSIGN_KEY_FORMATTERS_HPP
