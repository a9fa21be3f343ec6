/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/algorithm_identifier.hpp"

namespace kmsign {

  char const *getDigestEmsaName(SigningAlgorithm algorithm) {
    // clang-format off
    switch (algorithm) {
      case SigningAlgorithm::kRsassaPssSha256:      return "PSSR_Raw(SHA-256)";
      case SigningAlgorithm::kRsassaPssSha384:      return "PSSR_Raw(SHA-384)";
      case SigningAlgorithm::kRsassaPssSha512:      return "PSSR_Raw(SHA-512)";
      case SigningAlgorithm::kRsassaPkcs1V15Sha256: return "EMSA3(Raw,SHA-256)";
      case SigningAlgorithm::kRsassaPkcs1V15Sha384: return "EMSA3(Raw,SHA-384)";
      case SigningAlgorithm::kRsassaPkcs1V15Sha512: return "EMSA3(Raw,SHA-512)";
      // ECDSA consumes the digest as is and truncates it to the order size
      case SigningAlgorithm::kEcdsaSha256:
      case SigningAlgorithm::kEcdsaSha384:
      case SigningAlgorithm::kEcdsaSha512:          return "Raw";
    }
    // clang-format on
    return "Raw";
  }

  Botan::Signature_Format getSignatureFormat(SigningAlgorithm algorithm) {
    return familyOf(algorithm) == AlgorithmFamily::kEcdsa
        ? Botan::DER_SEQUENCE
        : Botan::IEEE_1363;
  }

}  // namespace kmsign
