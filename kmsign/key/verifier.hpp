/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KEY_VERIFIER_HPP
#define KMSIGN_KEY_VERIFIER_HPP

#include <string>

#include "common/result_fwd.hpp"
#include "key/key_descriptor.hpp"
#include "key/signature.hpp"

namespace kmsign {

  /**
   * Verify a signature over a digest against the public key of a descriptor.
   * @param descriptor holding the public key
   * @param digest the signed digest
   * @param signature to check, its algorithm selects the padding and hash
   * @return nothing if the signature is valid, otherwise a description
   */
  expected::Result<void, std::string> verifyDigestSignature(
      KeyDescriptor const &descriptor,
      Bytes const &digest,
      Signature const &signature);

}  // namespace kmsign

#endif  // KMSIGN_KEY_VERIFIER_HPP
