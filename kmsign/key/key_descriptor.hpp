/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KEY_KEY_DESCRIPTOR_HPP
#define KMSIGN_KEY_KEY_DESCRIPTOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/result_fwd.hpp"
#include "key/kms_error.hpp"
#include "key/signing_algorithm.hpp"

namespace kmsign {

  using Bytes = std::vector<uint8_t>;

  /// Length of the derived key id, a SHA-256 hash
  constexpr std::size_t kDerivedKeyIdLength = 32;

  /**
   * Public identity of a signing key. Immutable once created; a new
   * descriptor is built if the public key is ever fetched again.
   */
  struct KeyDescriptor {
    std::string key_reference;
    /// canonical DER SubjectPublicKeyInfo
    Bytes public_key_der;
    AlgorithmFamily algorithm_family;
    /// RSA modulus bits or EC field bits
    std::size_t key_bits;
    /// set for kEcdsa only
    std::optional<EllipticCurve> curve;
    /// signing algorithms the key holder reported for this key
    std::vector<SigningAlgorithm> supported_algorithms;
    /// SHA-256 of public_key_der
    Bytes derived_key_id;

    std::string keyIdHex() const;

    std::string toString() const;
  };

  /**
   * Compute the stable key id of a public key.
   * @param public_key_der canonical DER encoding of the key
   * @return SHA-256 of the encoding
   */
  Bytes deriveKeyId(Bytes const &public_key_der);

  /**
   * Decode and classify a DER SubjectPublicKeyInfo.
   * @param key_reference of the key the encoding belongs to
   * @param der_public_key encoding as returned by the key holder
   * @param supported_algorithms algorithms the key holder allows for the key
   * @return the descriptor, or kKeyFormat if the bytes are not an RSA or EC
   * public key, or kUnsupportedKey if the RSA size or the curve is not
   * supported
   */
  expected::Result<KeyDescriptor, KmsError> describePublicKey(
      std::string key_reference,
      Bytes const &der_public_key,
      std::vector<SigningAlgorithm> supported_algorithms);

}  // namespace kmsign

#endif  // KMSIGN_KEY_KEY_DESCRIPTOR_HPP
