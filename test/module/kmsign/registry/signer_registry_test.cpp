/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/signer_registry.hpp"

#include <fstream>

#include <gtest/gtest.h>
#include <boost/filesystem/operations.hpp>
#include <botan/pk_keys.h>
#include "common/cancellation.hpp"
#include "common/result.hpp"
#include "framework/result_gtest_checkers.hpp"
#include "framework/software_key_management_client.hpp"
#include "framework/test_keys.hpp"
#include "framework/test_logger.hpp"
#include "key/verifier.hpp"
#include "registry/default_signer_registry.hpp"

using namespace kmsign;
using namespace std::chrono_literals;

namespace fs = boost::filesystem;

namespace {
  /// Signer that only remembers where it was made from
  class NamedSigner : public Signer {
   public:
    explicit NamedSigner(std::string name) : name_(std::move(name)) {}

    expected::Result<Signature, KmsError> sign(
        Bytes const &, CancellationToken const &) const override {
      return expected::makeError(KmsError::cancelled(name_));
    }

    expected::Result<Signature, KmsError> signDigest(
        Bytes const &, CancellationToken const &) const override {
      return expected::makeError(KmsError::cancelled(name_));
    }

    expected::Result<std::shared_ptr<const KeyDescriptor>, KmsError> publicKey(
        CancellationToken const &) const override {
      return expected::makeError(KmsError::cancelled(name_));
    }

    std::string toString() const override {
      return name_;
    }

   private:
    std::string name_;
  };

  SignerRegistry::SignerFactory namedFactory(std::string prefix) {
    return [prefix](KeyReferenceUri const &uri)
               -> expected::Result<std::unique_ptr<Signer>, KmsError> {
      std::unique_ptr<Signer> signer =
          std::make_unique<NamedSigner>(prefix + uri.location);
      return expected::makeValue(std::move(signer));
    };
  }
}  // namespace

class SignerRegistryTest : public ::testing::Test {
 public:
  SignerRegistry registry_{framework::getTestLogger("SignerRegistry")};
};

/**
 * @given a registry with two schemes
 * @when signers are made for URIs of either scheme in any case
 * @then the factory of the scheme builds the signer from the location
 */
TEST_F(SignerRegistryTest, DispatchesByScheme) {
  registry_.registerScheme("Mem", namedFactory("mem:"));
  registry_.registerScheme("hsm", namedFactory("hsm:"));

  auto mem = registry_.makeSigner("MEM://key-1");
  KMSIGN_ASSERT_RESULT_VALUE(mem);
  EXPECT_EQ(mem.assumeValue()->toString(), "mem:key-1");

  auto hsm = registry_.makeSigner("hsm://slot/0");
  KMSIGN_ASSERT_RESULT_VALUE(hsm);
  EXPECT_EQ(hsm.assumeValue()->toString(), "hsm:slot/0");

  EXPECT_TRUE(registry_.isSchemeSupported("mem"));
  EXPECT_TRUE(registry_.isSchemeSupported("HSM"));
  EXPECT_FALSE(registry_.isSchemeSupported("kms"));
  EXPECT_EQ(registry_.getSupportedSchemes(),
            (std::vector<std::string>{"hsm", "mem"}));
}

/**
 * @given a registry without the scheme of a URI
 * @when a signer is made for it
 * @then it fails with UnsupportedScheme naming the supported schemes
 */
TEST_F(SignerRegistryTest, UnknownSchemeIsUnsupported) {
  registry_.registerScheme("mem", namedFactory("mem:"));

  auto result = registry_.makeSigner("gcpkms://projects/p/keys/k");
  KMSIGN_ASSERT_RESULT_ERROR_CODE(result, KmsErrorCode::kUnsupportedScheme);
  EXPECT_NE(result.assumeError().message.find("mem"), std::string::npos);
}

/**
 * @given a registered scheme
 * @when it is registered again
 * @then the new factory replaces the old one
 */
TEST_F(SignerRegistryTest, ReRegistrationReplacesFactory) {
  registry_.registerScheme("mem", namedFactory("old:"));
  registry_.registerScheme("MEM", namedFactory("new:"));

  auto signer = registry_.makeSigner("mem://k");
  KMSIGN_ASSERT_RESULT_VALUE(signer);
  EXPECT_EQ(signer.assumeValue()->toString(), "new:k");
  EXPECT_EQ(registry_.getSupportedSchemes().size(), 1u);
}

class DefaultSignerRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    fs::create_directory(test_dir_);
    client_ = std::make_shared<framework::SoftwareKeyManagementClient>();
  }

  void TearDown() override {
    fs::remove_all(test_dir_);
  }

  std::unique_ptr<SignerRegistry> makeRegistry(
      std::shared_ptr<kms::KeyManagementClient> client) {
    kms::RetryPolicy policy;
    policy.base_delay = 1ms;
    policy.max_delay = 2ms;
    return makeDefaultSignerRegistry(std::move(client),
                                     SigningScheme{},
                                     policy,
                                     framework::getTestLoggerManager());
  }

  const fs::path test_dir_ = fs::temp_directory_path() / fs::unique_path();
  std::shared_ptr<framework::SoftwareKeyManagementClient> client_;
  CancellationToken cancel_;
};

/**
 * @given the default registry with a service client holding a key
 * @when a signer is made for the kms URI of the key and signs a digest
 * @then the signature verifies against the key
 */
TEST_F(DefaultSignerRegistryTest, KmsScheme) {
  client_->addKey("alias/root", framework::getRsa2048Key());
  auto registry = makeRegistry(client_);
  EXPECT_EQ(registry->getSupportedSchemes(),
            (std::vector<std::string>{kFileScheme, kKmsScheme}));

  auto signer = registry->makeSigner("kms://alias/root");
  KMSIGN_ASSERT_RESULT_VALUE(signer);
  EXPECT_EQ(client_->getPublicKeyCalls(), 0u);

  Bytes const digest(32, 0x07);
  auto signature = signer.assumeValue()->signDigest(digest, cancel_);
  KMSIGN_ASSERT_RESULT_VALUE(signature);
  auto descriptor = signer.assumeValue()->publicKey(cancel_);
  KMSIGN_ASSERT_RESULT_VALUE(descriptor);
  KMSIGN_ASSERT_RESULT_VALUE(verifyDigestSignature(
      *descriptor.assumeValue(), digest, signature.assumeValue()));
}

/**
 * @given the default registry and a PKCS#8 file
 * @when a signer is made for the file URI
 * @then it holds the key of the file
 */
TEST_F(DefaultSignerRegistryTest, FileScheme) {
  auto const path = test_dir_ / "root.pem";
  {
    std::ofstream out(path.string());
    out << framework::privateKeyPem(*framework::getRsa2048Key());
  }
  auto registry = makeRegistry(client_);

  auto signer = registry->makeSigner("file://" + path.string());
  KMSIGN_ASSERT_RESULT_VALUE(signer);
  auto descriptor = signer.assumeValue()->publicKey(cancel_);
  KMSIGN_ASSERT_RESULT_VALUE(descriptor);
  EXPECT_EQ(descriptor.assumeValue()->public_key_der,
            framework::publicKeyDer(*framework::getRsa2048Key()));

  auto missing = registry->makeSigner("file://" + (test_dir_ / "x").string());
  KMSIGN_ASSERT_RESULT_ERROR_CODE(missing, KmsErrorCode::kKeyFormat);
}

/**
 * @given the default registry without a service client
 * @when a signer is made for a kms URI
 * @then it fails with UnsupportedScheme
 */
TEST_F(DefaultSignerRegistryTest, KmsSchemeNeedsClient) {
  auto registry = makeRegistry(nullptr);
  EXPECT_FALSE(registry->isSchemeSupported(kKmsScheme));

  auto result = registry->makeSigner("kms://alias/root");
  KMSIGN_ASSERT_RESULT_ERROR_CODE(result, KmsErrorCode::kUnsupportedScheme);
}
