/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "framework/test_keys.hpp"

#include <mutex>

#include <botan/auto_rng.h>
#include <botan/ec_group.h>
#include <botan/ecdsa.h>
#include <botan/pkcs8.h>
#include <botan/rsa.h>
#include <botan/x509_key.h>

namespace framework {

  Botan::RandomNumberGenerator &getTestRng() {
    thread_local Botan::AutoSeeded_RNG rng;
    return rng;
  }

  std::unique_ptr<Botan::Private_Key> makeRsaKey(std::size_t bits) {
    return std::make_unique<Botan::RSA_PrivateKey>(getTestRng(), bits);
  }

  std::unique_ptr<Botan::Private_Key> makeEcdsaKey(std::string const &curve) {
    return std::make_unique<Botan::ECDSA_PrivateKey>(getTestRng(),
                                                     Botan::EC_Group(curve));
  }

  std::shared_ptr<Botan::Private_Key> getRsa2048Key() {
    static std::once_flag flag;
    static std::shared_ptr<Botan::Private_Key> key;
    std::call_once(flag, [] { key = makeRsaKey(2048); });
    return key;
  }

  kmsign::Bytes publicKeyDer(Botan::Private_Key const &key) {
    return Botan::X509::BER_encode(key);
  }

  std::string privateKeyPem(Botan::Private_Key const &key) {
    return Botan::PKCS8::PEM_encode(key);
  }

}  // namespace framework
