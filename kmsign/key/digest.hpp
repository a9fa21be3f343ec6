/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KEY_DIGEST_HPP
#define KMSIGN_KEY_DIGEST_HPP

#include <cstdint>
#include <vector>

#include "key/signing_algorithm.hpp"

namespace kmsign {

  /// Hash @a message with @a digest
  std::vector<uint8_t> computeDigest(DigestAlgorithm digest,
                                     std::vector<uint8_t> const &message);

}  // namespace kmsign

#endif  // KMSIGN_KEY_DIGEST_HPP
