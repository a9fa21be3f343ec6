/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/digest.hpp"

#include <botan/hash.h>

std::vector<uint8_t> kmsign::computeDigest(
    DigestAlgorithm digest, std::vector<uint8_t> const &message) {
  auto hash = Botan::HashFunction::create_or_throw(toString(digest));
  hash->update(message);
  auto const result = hash->final();
  return std::vector<uint8_t>(result.begin(), result.end());
}
