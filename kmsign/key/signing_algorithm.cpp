/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/signing_algorithm.hpp"

#include <algorithm>
#include <array>
#include <ciso646>
#include <iterator>

namespace {
  using kmsign::AlgorithmFamily;
  using kmsign::DigestAlgorithm;
  using kmsign::EllipticCurve;
  using kmsign::RsaPadding;
  using kmsign::SigningAlgorithm;

  struct MappingEntry {
    AlgorithmFamily family;
    std::optional<EllipticCurve> curve;
    std::optional<RsaPadding> padding;
    DigestAlgorithm digest;
    SigningAlgorithm algorithm;
  };

  // clang-format off
  const std::array<MappingEntry, 10> kMappingTable{{
    {AlgorithmFamily::kRsa,   std::nullopt,               RsaPadding::kPss,      DigestAlgorithm::kSha256, SigningAlgorithm::kRsassaPssSha256},
    {AlgorithmFamily::kRsa,   std::nullopt,               RsaPadding::kPss,      DigestAlgorithm::kSha384, SigningAlgorithm::kRsassaPssSha384},
    {AlgorithmFamily::kRsa,   std::nullopt,               RsaPadding::kPss,      DigestAlgorithm::kSha512, SigningAlgorithm::kRsassaPssSha512},
    {AlgorithmFamily::kRsa,   std::nullopt,               RsaPadding::kPkcs1v15, DigestAlgorithm::kSha256, SigningAlgorithm::kRsassaPkcs1V15Sha256},
    {AlgorithmFamily::kRsa,   std::nullopt,               RsaPadding::kPkcs1v15, DigestAlgorithm::kSha384, SigningAlgorithm::kRsassaPkcs1V15Sha384},
    {AlgorithmFamily::kRsa,   std::nullopt,               RsaPadding::kPkcs1v15, DigestAlgorithm::kSha512, SigningAlgorithm::kRsassaPkcs1V15Sha512},
    {AlgorithmFamily::kEcdsa, EllipticCurve::kNistP256,   std::nullopt,          DigestAlgorithm::kSha256, SigningAlgorithm::kEcdsaSha256},
    {AlgorithmFamily::kEcdsa, EllipticCurve::kSecp256k1,  std::nullopt,          DigestAlgorithm::kSha256, SigningAlgorithm::kEcdsaSha256},
    {AlgorithmFamily::kEcdsa, EllipticCurve::kNistP384,   std::nullopt,          DigestAlgorithm::kSha384, SigningAlgorithm::kEcdsaSha384},
    {AlgorithmFamily::kEcdsa, EllipticCurve::kNistP521,   std::nullopt,          DigestAlgorithm::kSha512, SigningAlgorithm::kEcdsaSha512},
  }};

  const std::array<std::pair<SigningAlgorithm, char const *>, 9> kServiceNames{{
    {SigningAlgorithm::kRsassaPssSha256,       "RSASSA_PSS_SHA_256"},
    {SigningAlgorithm::kRsassaPssSha384,       "RSASSA_PSS_SHA_384"},
    {SigningAlgorithm::kRsassaPssSha512,       "RSASSA_PSS_SHA_512"},
    {SigningAlgorithm::kRsassaPkcs1V15Sha256,  "RSASSA_PKCS1_V1_5_SHA_256"},
    {SigningAlgorithm::kRsassaPkcs1V15Sha384,  "RSASSA_PKCS1_V1_5_SHA_384"},
    {SigningAlgorithm::kRsassaPkcs1V15Sha512,  "RSASSA_PKCS1_V1_5_SHA_512"},
    {SigningAlgorithm::kEcdsaSha256,           "ECDSA_SHA_256"},
    {SigningAlgorithm::kEcdsaSha384,           "ECDSA_SHA_384"},
    {SigningAlgorithm::kEcdsaSha512,           "ECDSA_SHA_512"},
  }};
  // clang-format on

  constexpr std::array<std::size_t, 3> kRsaKeySizes{2048, 3072, 4096};
}  // namespace

namespace kmsign {

  char const *toString(SigningAlgorithm algorithm) {
    auto it = std::find_if(
        kServiceNames.begin(), kServiceNames.end(), [algorithm](auto const &p) {
          return p.first == algorithm;
        });
    return it != kServiceNames.end() ? it->second : "UNKNOWN";
  }

  std::optional<SigningAlgorithm> signingAlgorithmFromString(
      std::string_view name) {
    auto it = std::find_if(
        kServiceNames.begin(), kServiceNames.end(), [name](auto const &p) {
          return name == p.second;
        });
    if (it == kServiceNames.end()) {
      return std::nullopt;
    }
    return it->first;
  }

  char const *toString(DigestAlgorithm digest) {
    switch (digest) {
      case DigestAlgorithm::kSha256:
        return "SHA-256";
      case DigestAlgorithm::kSha384:
        return "SHA-384";
      case DigestAlgorithm::kSha512:
        return "SHA-512";
    }
    return "UNKNOWN";
  }

  char const *toString(EllipticCurve curve) {
    switch (curve) {
      case EllipticCurve::kNistP256:
        return "secp256r1";
      case EllipticCurve::kNistP384:
        return "secp384r1";
      case EllipticCurve::kNistP521:
        return "secp521r1";
      case EllipticCurve::kSecp256k1:
        return "secp256k1";
    }
    return "UNKNOWN";
  }

  char const *toString(AlgorithmFamily family) {
    switch (family) {
      case AlgorithmFamily::kRsa:
        return "RSA";
      case AlgorithmFamily::kEcdsa:
        return "ECDSA";
    }
    return "UNKNOWN";
  }

  std::size_t digestLength(DigestAlgorithm digest) {
    switch (digest) {
      case DigestAlgorithm::kSha256:
        return 32;
      case DigestAlgorithm::kSha384:
        return 48;
      case DigestAlgorithm::kSha512:
        return 64;
    }
    return 0;
  }

  DigestAlgorithm digestOf(SigningAlgorithm algorithm) {
    switch (algorithm) {
      case SigningAlgorithm::kRsassaPssSha256:
      case SigningAlgorithm::kRsassaPkcs1V15Sha256:
      case SigningAlgorithm::kEcdsaSha256:
        return DigestAlgorithm::kSha256;
      case SigningAlgorithm::kRsassaPssSha384:
      case SigningAlgorithm::kRsassaPkcs1V15Sha384:
      case SigningAlgorithm::kEcdsaSha384:
        return DigestAlgorithm::kSha384;
      case SigningAlgorithm::kRsassaPssSha512:
      case SigningAlgorithm::kRsassaPkcs1V15Sha512:
      case SigningAlgorithm::kEcdsaSha512:
        return DigestAlgorithm::kSha512;
    }
    return DigestAlgorithm::kSha256;
  }

  AlgorithmFamily familyOf(SigningAlgorithm algorithm) {
    switch (algorithm) {
      case SigningAlgorithm::kEcdsaSha256:
      case SigningAlgorithm::kEcdsaSha384:
      case SigningAlgorithm::kEcdsaSha512:
        return AlgorithmFamily::kEcdsa;
      default:
        return AlgorithmFamily::kRsa;
    }
  }

  std::optional<SigningAlgorithm> selectSigningAlgorithm(
      AlgorithmFamily family,
      std::optional<EllipticCurve> curve,
      SigningScheme const &scheme) {
    auto it = std::find_if(
        kMappingTable.begin(), kMappingTable.end(), [&](auto const &entry) {
          if (entry.family != family or entry.digest != scheme.digest) {
            return false;
          }
          if (family == AlgorithmFamily::kRsa) {
            return entry.padding == scheme.rsa_padding;
          }
          return curve and entry.curve == curve;
        });
    if (it == kMappingTable.end()) {
      return std::nullopt;
    }
    return it->algorithm;
  }

  std::vector<SigningAlgorithm> getAllSigningAlgorithms() {
    std::vector<SigningAlgorithm> result;
    std::transform(kServiceNames.begin(),
                   kServiceNames.end(),
                   std::back_inserter(result),
                   [](auto const &p) { return p.first; });
    return result;
  }

  std::vector<SigningAlgorithm> getAlgorithmsForKey(
      AlgorithmFamily family, std::optional<EllipticCurve> curve) {
    std::vector<SigningAlgorithm> result;
    for (auto const &entry : kMappingTable) {
      if (entry.family == family
          and (family == AlgorithmFamily::kRsa or entry.curve == curve)) {
        result.push_back(entry.algorithm);
      }
    }
    return result;
  }

  bool isSupportedRsaKeySize(std::size_t bits) {
    return std::find(kRsaKeySizes.begin(), kRsaKeySizes.end(), bits)
        != kRsaKeySizes.end();
  }

}  // namespace kmsign
