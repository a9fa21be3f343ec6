/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/algorithm_selection.hpp"

#include <algorithm>

#include <fmt/core.h>
#include "common/result.hpp"
#include "key/formatters.hpp"

using namespace kmsign;
using namespace kmsign::expected;

Result<SigningAlgorithm, KmsError> kmsign::selectAlgorithm(
    KeyDescriptor const &descriptor, SigningScheme const &scheme) {
  auto const algorithm = selectSigningAlgorithm(
      descriptor.algorithm_family, descriptor.curve, scheme);
  if (not algorithm) {
    return makeError(KmsError::unsupportedAlgorithm(
        fmt::format("no signing algorithm for {} key '{}' with {}",
                    descriptor.algorithm_family,
                    descriptor.key_reference,
                    scheme.digest)));
  }

  auto const &supported = descriptor.supported_algorithms;
  if (std::find(supported.begin(), supported.end(), *algorithm)
      == supported.end()) {
    return makeError(KmsError::unsupportedAlgorithm(
        fmt::format("key '{}' does not support {}",
                    descriptor.key_reference,
                    *algorithm)));
  }
  return makeValue(*algorithm);
}

Result<void, KmsError> kmsign::checkDigestLength(
    KeyDescriptor const &descriptor,
    SigningAlgorithm algorithm,
    Bytes const &digest) {
  auto const expected_length = digestLength(digestOf(algorithm));
  if (digest.size() != expected_length) {
    return makeError(KmsError::unsupportedAlgorithm(
        fmt::format("{} for key '{}' needs a {} byte digest, got {} bytes",
                    algorithm,
                    descriptor.key_reference,
                    expected_length,
                    digest.size())));
  }
  return makeValue();
}
