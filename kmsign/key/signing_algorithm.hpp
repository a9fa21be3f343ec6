/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KEY_SIGNING_ALGORITHM_HPP
#define KMSIGN_KEY_SIGNING_ALGORITHM_HPP

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace kmsign {

  enum class AlgorithmFamily { kRsa, kEcdsa };

  enum class EllipticCurve { kNistP256, kNistP384, kNistP521, kSecp256k1 };

  enum class DigestAlgorithm { kSha256, kSha384, kSha512 };

  enum class RsaPadding { kPss, kPkcs1v15 };

  /// Signing algorithm identifiers recognized by the key-management service
  enum class SigningAlgorithm {
    kRsassaPssSha256,
    kRsassaPssSha384,
    kRsassaPssSha512,
    kRsassaPkcs1V15Sha256,
    kRsassaPkcs1V15Sha384,
    kRsassaPkcs1V15Sha512,
    kEcdsaSha256,
    kEcdsaSha384,
    kEcdsaSha512,
  };

  /**
   * The signature scheme dictated by the metadata format being signed. It is
   * fixed for the lifetime of a signer.
   */
  struct SigningScheme {
    DigestAlgorithm digest{DigestAlgorithm::kSha256};
    RsaPadding rsa_padding{RsaPadding::kPss};
  };

  /// Service identifier, e.g. "RSASSA_PSS_SHA_256"
  char const *toString(SigningAlgorithm algorithm);

  std::optional<SigningAlgorithm> signingAlgorithmFromString(
      std::string_view name);

  /// Botan hash name, e.g. "SHA-256"
  char const *toString(DigestAlgorithm digest);

  /// Botan curve name, e.g. "secp256r1"
  char const *toString(EllipticCurve curve);

  char const *toString(AlgorithmFamily family);

  std::size_t digestLength(DigestAlgorithm digest);

  DigestAlgorithm digestOf(SigningAlgorithm algorithm);

  AlgorithmFamily familyOf(SigningAlgorithm algorithm);

  /**
   * Look up the static mapping table.
   * @param family of the key
   * @param curve of the key, must be set for kEcdsa and is ignored for kRsa
   * @param scheme the host signing scheme
   * @return the signing algorithm, or nullopt if the combination has none
   */
  std::optional<SigningAlgorithm> selectSigningAlgorithm(
      AlgorithmFamily family,
      std::optional<EllipticCurve> curve,
      SigningScheme const &scheme);

  std::vector<SigningAlgorithm> getAllSigningAlgorithms();

  /// Every algorithm of the mapping table that can be used with a key
  std::vector<SigningAlgorithm> getAlgorithmsForKey(
      AlgorithmFamily family, std::optional<EllipticCurve> curve);

  /// RSA modulus sizes the service can hold
  bool isSupportedRsaKeySize(std::size_t bits);

}  // namespace kmsign

#endif  // KMSIGN_KEY_SIGNING_ALGORITHM_HPP
