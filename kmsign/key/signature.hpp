/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KEY_SIGNATURE_HPP
#define KMSIGN_KEY_SIGNATURE_HPP

#include <string>

#include "common/result_fwd.hpp"
#include "key/key_descriptor.hpp"
#include "key/kms_error.hpp"
#include "key/signing_algorithm.hpp"

namespace kmsign {

  /// A validated signature together with what produced it
  struct Signature {
    Bytes bytes;
    SigningAlgorithm algorithm;
    std::string key_id_hex;

    /// Describes the signature without its bytes
    std::string toString() const;
  };

  /**
   * Check the encoding of signature bytes produced for a key. RSA signatures
   * must be exactly as long as the modulus. ECDSA signatures must be a DER
   * SEQUENCE of two INTEGERs in the range (0, n) of the key's curve, with no
   * trailing data and no BER-only encodings.
   * @param descriptor of the key that produced the signature
   * @param algorithm the signature was requested with
   * @param signature bytes to check
   * @return nothing, or kInvalidSignatureEncoding
   */
  expected::Result<void, KmsError> validateSignatureEncoding(
      KeyDescriptor const &descriptor,
      SigningAlgorithm algorithm,
      Bytes const &signature);

}  // namespace kmsign

#endif  // KMSIGN_KEY_SIGNATURE_HPP
