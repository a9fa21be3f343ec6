/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KEY_ALGORITHM_IDENTIFIER_HPP
#define KMSIGN_KEY_ALGORITHM_IDENTIFIER_HPP

#include <botan/pk_keys.h>
#include "key/signing_algorithm.hpp"

namespace kmsign {

  /**
   * Botan EMSA name that signs or verifies a precomputed digest of the
   * algorithm's hash, e.g. "PSSR_Raw(SHA-256)".
   */
  char const *getDigestEmsaName(SigningAlgorithm algorithm);

  /// Signature layout Botan must produce or expect for the algorithm
  Botan::Signature_Format getSignatureFormat(SigningAlgorithm algorithm);

}  // namespace kmsign

#endif  // KMSIGN_KEY_ALGORITHM_IDENTIFIER_HPP
