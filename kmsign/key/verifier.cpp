/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/verifier.hpp"

#include <memory>

#include <botan/data_src.h>
#include <botan/exceptn.h>
#include <botan/pubkey.h>
#include <botan/x509_key.h>
#include <fmt/core.h>
#include "common/result.hpp"
#include "key/algorithm_identifier.hpp"
#include "key/formatters.hpp"

using namespace kmsign;

expected::Result<void, std::string> kmsign::verifyDigestSignature(
    KeyDescriptor const &descriptor,
    Bytes const &digest,
    Signature const &signature) {
  try {
    Botan::DataSource_Memory source(descriptor.public_key_der);
    std::unique_ptr<Botan::Public_Key> public_key(
        Botan::X509::load_key(source));

    Botan::PK_Verifier verifier(*public_key,
                                getDigestEmsaName(signature.algorithm),
                                getSignatureFormat(signature.algorithm));
    if (verifier.verify_message(digest, signature.bytes)) {
      return expected::makeValue();
    }
    return expected::makeError(std::string{"Wrong signature."});
  } catch (Botan::Exception const &e) {
    return expected::makeError(
        fmt::format("Could not verify signature: {}", e));
  }
}
