/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/key_reference_uri.hpp"

#include <algorithm>
#include <cctype>

#include <boost/algorithm/string/case_conv.hpp>
#include <fmt/core.h>
#include "common/result.hpp"

using namespace kmsign;
using namespace kmsign::expected;

namespace {
  constexpr std::string_view kSeparator = "://";

  bool isSchemeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) or c == '+' or c == '-'
        or c == '.';
  }
}  // namespace

std::string KeyReferenceUri::toString() const {
  return fmt::format("{}{}{}", scheme, kSeparator, location);
}

Result<KeyReferenceUri, KmsError> KeyReferenceUri::parse(std::string_view uri) {
  auto const separator = uri.find(kSeparator);
  if (separator == std::string_view::npos or separator == 0) {
    return makeError(KmsError::unsupportedScheme(
        fmt::format("key reference '{}' has no URI scheme", uri)));
  }

  auto const scheme = uri.substr(0, separator);
  if (not std::all_of(scheme.begin(), scheme.end(), isSchemeChar)
      or not std::isalpha(static_cast<unsigned char>(scheme.front()))) {
    return makeError(KmsError::unsupportedScheme(
        fmt::format("key reference '{}' has a malformed URI scheme", uri)));
  }

  auto const location = uri.substr(separator + kSeparator.size());
  if (location.empty()) {
    return makeError(KmsError::unsupportedScheme(
        fmt::format("key reference '{}' names no key", uri)));
  }

  return makeValue(KeyReferenceUri{boost::algorithm::to_lower_copy(
                                       std::string{scheme}),
                                   std::string{location}});
}
