/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "local/file_signer.hpp"

#include <fstream>

#include <gtest/gtest.h>
#include <boost/filesystem/operations.hpp>
#include <botan/pk_keys.h>
#include <botan/pkcs8.h>
#include <botan/pubkey.h>
#include "common/cancellation.hpp"
#include "common/result.hpp"
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_keys.hpp"
#include "framework/test_logger.hpp"
#include "key/verifier.hpp"

using namespace kmsign;
using namespace kmsign::local;

namespace fs = boost::filesystem;

class FileSignerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    fs::create_directory(test_dir_);
  }

  void TearDown() override {
    fs::remove_all(test_dir_);
  }

  fs::path writeFile(std::string const &name, std::string const &contents) {
    auto const path = test_dir_ / name;
    std::ofstream out(path.string(), std::ios::binary | std::ios::trunc);
    out << contents;
    return path;
  }

  fs::path writePem(std::string const &name, Botan::Private_Key const &key) {
    return writeFile(name, framework::privateKeyPem(key));
  }

  expected::Result<std::unique_ptr<FileSigner>, KmsError> create(
      fs::path const &path, SigningScheme scheme = {}) {
    return FileSigner::create(
        path, scheme, framework::getTestLogger("FileSigner"));
  }

  KmsErrorCode createError(fs::path const &path, SigningScheme scheme = {}) {
    return create(path, scheme).assumeError().code;
  }

  const fs::path test_dir_ = fs::temp_directory_path() / fs::unique_path();
  CancellationToken cancel_;
};

/**
 * @given an RSA key in a PKCS#8 PEM file
 * @when a signer is created and signs a digest
 * @then the signature uses PSS with SHA-256 and verifies against the
 * signer's public key
 */
TEST_F(FileSignerTest, SignsWithPemRsaKey) {
  auto signer = create(writePem("rsa.pem", *framework::getRsa2048Key()));
  KMSIGN_ASSERT_RESULT_VALUE(signer);

  auto descriptor = signer.assumeValue()->publicKey(cancel_);
  KMSIGN_ASSERT_RESULT_VALUE(descriptor);
  EXPECT_EQ(descriptor.assumeValue()->public_key_der,
            framework::publicKeyDer(*framework::getRsa2048Key()));

  Bytes const digest(32, 0x00);
  auto signature = signer.assumeValue()->signDigest(digest, cancel_);
  KMSIGN_ASSERT_RESULT_VALUE(signature);
  EXPECT_EQ(signature.assumeValue().algorithm,
            SigningAlgorithm::kRsassaPssSha256);
  KMSIGN_ASSERT_RESULT_VALUE(verifyDigestSignature(
      *descriptor.assumeValue(), digest, signature.assumeValue()));
}

/**
 * @given a P-384 key in a PKCS#8 DER file
 * @when a message is signed under the SHA-384 scheme
 * @then a standard ECDSA verifier accepts the signature
 */
TEST_F(FileSignerTest, SignsMessageWithDerEcdsaKey) {
  auto key = framework::makeEcdsaKey("secp384r1");
  auto const der = Botan::PKCS8::BER_encode(*key);
  auto const path =
      writeFile("ec.der", std::string(der.begin(), der.end()));

  auto signer = create(path, {DigestAlgorithm::kSha384, RsaPadding::kPss});
  KMSIGN_ASSERT_RESULT_VALUE(signer);

  Bytes const message{'s', 'n', 'a', 'p', 's', 'h', 'o', 't'};
  auto signature = signer.assumeValue()->sign(message, cancel_);
  KMSIGN_ASSERT_RESULT_VALUE(signature);
  EXPECT_EQ(signature.assumeValue().algorithm,
            SigningAlgorithm::kEcdsaSha384);

  Botan::PK_Verifier verifier(*key, "EMSA1(SHA-384)", Botan::DER_SEQUENCE);
  EXPECT_TRUE(
      verifier.verify_message(message, signature.assumeValue().bytes));
}

/**
 * @given a path with no file
 * @when a signer is created
 * @then it fails with KeyFormat
 */
TEST_F(FileSignerTest, MissingFileIsKeyFormat) {
  EXPECT_EQ(createError(test_dir_ / "absent.pem"), KmsErrorCode::kKeyFormat);
}

/**
 * @given a file that is not a private key
 * @when a signer is created
 * @then it fails with KeyFormat
 */
TEST_F(FileSignerTest, GarbageIsKeyFormat) {
  EXPECT_EQ(createError(writeFile("garbage.pem", "not a key\n")),
            KmsErrorCode::kKeyFormat);
}

/**
 * @given a 1024 bit RSA key
 * @when a signer is created
 * @then it fails with UnsupportedKey
 */
TEST_F(FileSignerTest, SmallRsaKeyIsUnsupported) {
  auto key = framework::makeRsaKey(1024);
  EXPECT_EQ(createError(writePem("small.pem", *key)),
            KmsErrorCode::kUnsupportedKey);
}

/**
 * @given a P-256 key
 * @when a signer is created for the SHA-384 scheme
 * @then it fails with UnsupportedAlgorithm
 */
TEST_F(FileSignerTest, CurveDigestMismatchIsUnsupportedAlgorithm) {
  auto key = framework::makeEcdsaKey("secp256r1");
  EXPECT_EQ(createError(writePem("p256.pem", *key),
                        {DigestAlgorithm::kSha384, RsaPadding::kPss}),
            KmsErrorCode::kUnsupportedAlgorithm);
}

/**
 * @given a signer for the SHA-256 scheme
 * @when a digest of another length is signed, or the token is cancelled
 * @then it fails with UnsupportedAlgorithm or Cancelled respectively
 */
TEST_F(FileSignerTest, RejectsBadDigestAndCancellation) {
  auto signer = create(writePem("rsa.pem", *framework::getRsa2048Key()));
  KMSIGN_ASSERT_RESULT_VALUE(signer);

  auto short_digest = signer.assumeValue()->signDigest(Bytes(20), cancel_);
  KMSIGN_ASSERT_RESULT_ERROR_CODE(short_digest,
                                  KmsErrorCode::kUnsupportedAlgorithm);

  cancel_.cancel();
  auto cancelled = signer.assumeValue()->signDigest(Bytes(32), cancel_);
  KMSIGN_ASSERT_RESULT_ERROR_CODE(cancelled, KmsErrorCode::kCancelled);
}
