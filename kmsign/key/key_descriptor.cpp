/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/key_descriptor.hpp"

#include <array>
#include <ciso646>
#include <memory>

#include <botan/data_src.h>
#include <botan/ec_group.h>
#include <botan/ecc_key.h>
#include <botan/exceptn.h>
#include <botan/pk_keys.h>
#include <botan/rsa.h>
#include <botan/x509_key.h>
#include <fmt/core.h>
#include "common/hexutils.hpp"
#include "common/result.hpp"
#include "key/digest.hpp"
#include "key/formatters.hpp"

using namespace kmsign;
using namespace kmsign::expected;

namespace {
  const std::array<EllipticCurve, 4> kCurves{EllipticCurve::kNistP256,
                                             EllipticCurve::kNistP384,
                                             EllipticCurve::kNistP521,
                                             EllipticCurve::kSecp256k1};

  std::optional<EllipticCurve> findCurve(Botan::EC_Group const &group) {
    for (auto curve : kCurves) {
      if (group == Botan::EC_Group(toString(curve))) {
        return curve;
      }
    }
    return std::nullopt;
  }
}  // namespace

std::string KeyDescriptor::keyIdHex() const {
  return bytesToHexstring(derived_key_id);
}

std::string KeyDescriptor::toString() const {
  return fmt::format("{} key '{}' ({} bits{}{}), id {}",
                     algorithm_family,
                     key_reference,
                     key_bits,
                     curve ? ", curve " : "",
                     curve ? kmsign::toString(*curve) : "",
                     keyIdHex());
}

Bytes kmsign::deriveKeyId(Bytes const &public_key_der) {
  return computeDigest(DigestAlgorithm::kSha256, public_key_der);
}

Result<KeyDescriptor, KmsError> kmsign::describePublicKey(
    std::string key_reference,
    Bytes const &der_public_key,
    std::vector<SigningAlgorithm> supported_algorithms) {
  if (der_public_key.empty()) {
    return makeError(KmsError::keyFormat(
        fmt::format("empty public key for '{}'", key_reference)));
  }

  std::unique_ptr<Botan::Public_Key> public_key;
  try {
    Botan::DataSource_Memory source(der_public_key);
    public_key.reset(Botan::X509::load_key(source));
  } catch (Botan::Exception const &e) {
    return makeError(KmsError::keyFormat(fmt::format(
        "public key of '{}' is not a DER SubjectPublicKeyInfo: {}",
        key_reference,
        e.what())));
  }

  auto const algo_name = public_key->algo_name();
  if (algo_name != "RSA" and algo_name != "ECDSA") {
    return makeError(KmsError::keyFormat(
        fmt::format("key '{}' is a {} key, expected RSA or ECDSA",
                    key_reference,
                    algo_name)));
  }
  // PEM input and trailing data decode too, only the DER form is accepted
  auto encoded = Botan::X509::BER_encode(*public_key);
  if (encoded != der_public_key) {
    return makeError(KmsError::keyFormat(fmt::format(
        "public key of '{}' is not a DER SubjectPublicKeyInfo",
        key_reference)));
  }

  KeyDescriptor descriptor;
  descriptor.key_reference = std::move(key_reference);
  descriptor.supported_algorithms = std::move(supported_algorithms);

  if (auto const *rsa =
          dynamic_cast<Botan::RSA_PublicKey const *>(public_key.get())) {
    descriptor.algorithm_family = AlgorithmFamily::kRsa;
    descriptor.key_bits = rsa->get_n().bits();
    if (not isSupportedRsaKeySize(descriptor.key_bits)) {
      return makeError(KmsError::unsupportedKey(
          fmt::format("RSA key '{}' of {} bits is not supported",
                      descriptor.key_reference,
                      descriptor.key_bits)));
    }
  } else if (auto const *ec = dynamic_cast<Botan::EC_PublicKey const *>(
                 public_key.get())) {
    descriptor.algorithm_family = AlgorithmFamily::kEcdsa;
    descriptor.key_bits = ec->domain().get_p_bits();
    descriptor.curve = findCurve(ec->domain());
    if (not descriptor.curve) {
      return makeError(KmsError::unsupportedKey(
          fmt::format("curve of EC key '{}' ({} bits) is not supported",
                      descriptor.key_reference,
                      descriptor.key_bits)));
    }
  } else {
    return makeError(KmsError::keyFormat(
        fmt::format("key '{}' is a {} key, expected RSA or ECDSA",
                    descriptor.key_reference,
                    algo_name)));
  }

  descriptor.public_key_der = std::move(encoded);
  descriptor.derived_key_id = deriveKeyId(descriptor.public_key_der);
  return makeValue(std::move(descriptor));
}
