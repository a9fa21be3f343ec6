/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/signature.hpp"

#include <ciso646>

#include <botan/asn1_obj.h>
#include <botan/ber_dec.h>
#include <botan/bigint.h>
#include <botan/der_enc.h>
#include <botan/ec_group.h>
#include <botan/exceptn.h>
#include <fmt/core.h>
#include "common/result.hpp"
#include "key/formatters.hpp"

using namespace kmsign;
using namespace kmsign::expected;

namespace {
  Result<void, KmsError> invalid(KeyDescriptor const &descriptor,
                                 SigningAlgorithm algorithm,
                                 std::string const &reason) {
    return makeError(KmsError::invalidSignatureEncoding(
        fmt::format("{} signature for '{}' {}",
                    toString(algorithm),
                    descriptor.key_reference,
                    reason)));
  }

  Result<void, KmsError> validateEcdsa(KeyDescriptor const &descriptor,
                                       SigningAlgorithm algorithm,
                                       Bytes const &signature) {
    if (not descriptor.curve) {
      return invalid(descriptor, algorithm, "has no curve to check against");
    }

    Botan::BigInt r, s;
    try {
      Botan::BER_Decoder(signature)
          .start_cons(Botan::SEQUENCE)
          .decode(r)
          .decode(s)
          .end_cons()
          .verify_end();

      auto const reencoded = Botan::DER_Encoder()
                                 .start_cons(Botan::SEQUENCE)
                                 .encode(r)
                                 .encode(s)
                                 .end_cons()
                                 .get_contents_unlocked();
      if (reencoded != signature) {
        return invalid(descriptor, algorithm, "is not in DER form");
      }

      Botan::BigInt const order =
          Botan::EC_Group(toString(*descriptor.curve)).get_order();
      if (r.is_zero() or r.is_negative() or s.is_zero() or s.is_negative()
          or r >= order or s >= order) {
        return invalid(descriptor, algorithm, "has r or s out of range");
      }
    } catch (Botan::Exception const &e) {
      return invalid(descriptor,
                     algorithm,
                     fmt::format("could not be decoded: {}", e));
    }
    return makeValue();
  }
}  // namespace

std::string Signature::toString() const {
  return fmt::format("Signature {} of {} bytes by key {}",
                     kmsign::toString(algorithm),
                     bytes.size(),
                     key_id_hex);
}

Result<void, KmsError> kmsign::validateSignatureEncoding(
    KeyDescriptor const &descriptor,
    SigningAlgorithm algorithm,
    Bytes const &signature) {
  if (signature.empty()) {
    return invalid(descriptor, algorithm, "is empty");
  }
  if (familyOf(algorithm) != descriptor.algorithm_family) {
    return invalid(descriptor, algorithm, "does not match the key family");
  }

  switch (descriptor.algorithm_family) {
    case AlgorithmFamily::kRsa: {
      auto const modulus_bytes = (descriptor.key_bits + 7) / 8;
      if (signature.size() != modulus_bytes) {
        return invalid(descriptor,
                       algorithm,
                       fmt::format("is {} bytes long, expected {}",
                                   signature.size(),
                                   modulus_bytes));
      }
      return makeValue();
    }
    case AlgorithmFamily::kEcdsa:
      return validateEcdsa(descriptor, algorithm, signature);
  }
  return invalid(descriptor, algorithm, "has an unknown family");
}
