/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KEY_ALGORITHM_SELECTION_HPP
#define KMSIGN_KEY_ALGORITHM_SELECTION_HPP

#include "common/result_fwd.hpp"
#include "key/key_descriptor.hpp"
#include "key/kms_error.hpp"
#include "key/signing_algorithm.hpp"

namespace kmsign {

  /**
   * Pick the signing algorithm for a key under a signing scheme.
   * @return the algorithm from the mapping table, provided the key holder
   * listed it among the key's supported algorithms; otherwise
   * kUnsupportedAlgorithm
   */
  expected::Result<SigningAlgorithm, KmsError> selectAlgorithm(
      KeyDescriptor const &descriptor, SigningScheme const &scheme);

  /// Fails with kUnsupportedAlgorithm if @a digest is not of @a algorithm
  expected::Result<void, KmsError> checkDigestLength(
      KeyDescriptor const &descriptor,
      SigningAlgorithm algorithm,
      Bytes const &digest);

}  // namespace kmsign

#endif  // KMSIGN_KEY_ALGORITHM_SELECTION_HPP
