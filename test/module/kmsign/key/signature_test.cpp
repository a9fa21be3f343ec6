/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/signature.hpp"

#include <optional>

#include <gtest/gtest.h>
#include <botan/asn1_obj.h>
#include <botan/bigint.h>
#include <botan/der_enc.h>
#include <botan/ec_group.h>
#include <botan/pk_keys.h>
#include <botan/pubkey.h>
#include "common/hexutils.hpp"
#include "common/result.hpp"
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_keys.hpp"
#include "key/algorithm_identifier.hpp"

using namespace kmsign;
using namespace framework;

namespace {
  Bytes encodeEcdsa(Botan::BigInt const &r, Botan::BigInt const &s) {
    return Botan::DER_Encoder()
        .start_cons(Botan::SEQUENCE)
        .encode(r)
        .encode(s)
        .end_cons()
        .get_contents_unlocked();
  }
}  // namespace

class SignatureEncodingTest : public ::testing::Test {
 public:
  static void SetUpTestSuite() {
    ec_key_ = makeEcdsaKey("secp256r1");
  }

  static void TearDownTestSuite() {
    ec_key_.reset();
  }

  void SetUp() override {
    rsa_descriptor_ =
        describePublicKey("rsa", publicKeyDer(*getRsa2048Key()), {})
            .assumeValue();
    ec_descriptor_ =
        describePublicKey("ec", publicKeyDer(*ec_key_), {}).assumeValue();
  }

  Bytes signWithEcKey(Bytes const &digest) {
    Botan::PK_Signer signer(*ec_key_,
                            getTestRng(),
                            getDigestEmsaName(SigningAlgorithm::kEcdsaSha256),
                            Botan::DER_SEQUENCE);
    return signer.sign_message(digest, getTestRng());
  }

  std::optional<KmsErrorCode> ecdsaErrorCode(Bytes const &signature) {
    auto result = validateSignatureEncoding(
        ec_descriptor_, SigningAlgorithm::kEcdsaSha256, signature);
    if (auto error = kmsign::expected::resultToOptionalError(result)) {
      return error->code;
    }
    return std::nullopt;
  }

  static std::unique_ptr<Botan::Private_Key> ec_key_;
  KeyDescriptor rsa_descriptor_;
  KeyDescriptor ec_descriptor_;
  Botan::BigInt order_ = Botan::EC_Group("secp256r1").get_order();
};

std::unique_ptr<Botan::Private_Key> SignatureEncodingTest::ec_key_;

/**
 * @given an RSA key
 * @when signatures of several lengths are validated
 * @then only the one as long as the modulus passes
 */
TEST_F(SignatureEncodingTest, RsaLengthMustMatchModulus) {
  KMSIGN_ASSERT_RESULT_VALUE(validateSignatureEncoding(
      rsa_descriptor_, SigningAlgorithm::kRsassaPssSha256, Bytes(256, 1)));
  KMSIGN_ASSERT_RESULT_ERROR(validateSignatureEncoding(
      rsa_descriptor_, SigningAlgorithm::kRsassaPssSha256, Bytes(255, 1)));
  KMSIGN_ASSERT_RESULT_ERROR(validateSignatureEncoding(
      rsa_descriptor_, SigningAlgorithm::kRsassaPssSha256, Bytes(512, 1)));
}

/**
 * @given any key
 * @when an empty signature is validated
 * @then InvalidSignatureEncoding is reported
 */
TEST_F(SignatureEncodingTest, EmptySignatureRejected) {
  auto result = validateSignatureEncoding(
      rsa_descriptor_, SigningAlgorithm::kRsassaPkcs1V15Sha256, {});
  KMSIGN_ASSERT_RESULT_ERROR_CODE(result,
                                  KmsErrorCode::kInvalidSignatureEncoding);
  EXPECT_EQ(ecdsaErrorCode({}), KmsErrorCode::kInvalidSignatureEncoding);
}

/**
 * @given an ECDSA signature made by Botan
 * @when it is validated
 * @then it passes
 */
TEST_F(SignatureEncodingTest, RealEcdsaSignaturePasses) {
  KMSIGN_ASSERT_RESULT_VALUE(validateSignatureEncoding(
      ec_descriptor_,
      SigningAlgorithm::kEcdsaSha256,
      signWithEcKey(Bytes(32, 0))));
}

/**
 * @given a valid ECDSA signature with trailing bytes
 * @when it is validated
 * @then InvalidSignatureEncoding is reported
 */
TEST_F(SignatureEncodingTest, TrailingDataRejected) {
  auto signature = signWithEcKey(Bytes(32, 7));
  signature.push_back(0);
  EXPECT_EQ(ecdsaErrorCode(signature),
            KmsErrorCode::kInvalidSignatureEncoding);
}

/**
 * @given a valid ECDSA signature whose sequence length uses the long form
 * @when it is validated
 * @then it is rejected as not DER
 */
TEST_F(SignatureEncodingTest, NonMinimalLengthRejected) {
  auto const signature = signWithEcKey(Bytes(32, 9));
  ASSERT_LT(signature[1], 0x80);
  Bytes ber{signature[0], 0x81};
  ber.insert(ber.end(), signature.begin() + 1, signature.end());
  EXPECT_EQ(ecdsaErrorCode(ber), KmsErrorCode::kInvalidSignatureEncoding);
}

/**
 * @given ECDSA signatures with r or s out of (0, n)
 * @when they are validated
 * @then InvalidSignatureEncoding is reported
 */
TEST_F(SignatureEncodingTest, OutOfRangeScalarsRejected) {
  Botan::BigInt const one(1);
  EXPECT_EQ(ecdsaErrorCode(encodeEcdsa(Botan::BigInt(0), one)),
            KmsErrorCode::kInvalidSignatureEncoding);
  EXPECT_EQ(ecdsaErrorCode(encodeEcdsa(one, Botan::BigInt(0))),
            KmsErrorCode::kInvalidSignatureEncoding);
  EXPECT_EQ(ecdsaErrorCode(encodeEcdsa(order_, one)),
            KmsErrorCode::kInvalidSignatureEncoding);
  EXPECT_EQ(ecdsaErrorCode(encodeEcdsa(one, order_ + 1)),
            KmsErrorCode::kInvalidSignatureEncoding);
  KMSIGN_ASSERT_RESULT_VALUE(
      validateSignatureEncoding(ec_descriptor_,
                                SigningAlgorithm::kEcdsaSha256,
                                encodeEcdsa(order_ - 1, one)));
}

/**
 * @given the DER signature 30 06 02 01 00 02 01 00, with r = s = 0
 * @when it is validated
 * @then InvalidSignatureEncoding is reported
 */
TEST_F(SignatureEncodingTest, ZeroScalarsRejected) {
  auto const zeros = hexstringToBytesResult("3006020100020100").assumeValue();
  KMSIGN_ASSERT_RESULT_ERROR_CODE(
      validateSignatureEncoding(
          ec_descriptor_, SigningAlgorithm::kEcdsaSha256, zeros),
      KmsErrorCode::kInvalidSignatureEncoding);
}

/**
 * @given bytes that are not an ASN.1 sequence, or a fixed width r||s
 * @when they are validated as ECDSA signatures
 * @then InvalidSignatureEncoding is reported
 */
TEST_F(SignatureEncodingTest, NotDerRejected) {
  EXPECT_EQ(ecdsaErrorCode(Bytes(64, 0x11)),
            KmsErrorCode::kInvalidSignatureEncoding);
  EXPECT_EQ(ecdsaErrorCode({0x30, 0x06, 0x02, 0x01, 0x01}),
            KmsErrorCode::kInvalidSignatureEncoding);
}

/**
 * @given an algorithm of the other family than the key
 * @when a signature is validated
 * @then InvalidSignatureEncoding is reported
 */
TEST_F(SignatureEncodingTest, FamilyMismatchRejected) {
  KMSIGN_ASSERT_RESULT_ERROR(validateSignatureEncoding(
      ec_descriptor_, SigningAlgorithm::kRsassaPssSha256, Bytes(256, 1)));
}

/**
 * @given a signature
 * @when it is printed
 * @then the text names the algorithm and size but not the bytes
 */
TEST(SignatureTest, ToStringHidesBytes) {
  Signature signature{
      Bytes(4, 0xAB), SigningAlgorithm::kEcdsaSha256, "0011"};
  auto const text = signature.toString();
  EXPECT_NE(text.find("ECDSA_SHA_256"), std::string::npos);
  EXPECT_NE(text.find("4 bytes"), std::string::npos);
  EXPECT_EQ(text.find("abab"), std::string::npos);
}
