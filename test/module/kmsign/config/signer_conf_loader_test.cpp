/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/signer_conf_loader.hpp"

#include <fstream>

#include <gtest/gtest.h>
#include <boost/filesystem/operations.hpp>
#include "common/result.hpp"
#include "framework/result_gtest_checkers.hpp"

using namespace kmsign;
using namespace std::chrono_literals;

namespace {
  std::string parseError(std::string const &json) {
    auto result = parseSignerConfig(json);
    if (auto error = expected::resultToOptionalError(result)) {
      return *error;
    }
    return "no error";
  }
}  // namespace

/**
 * @given a configuration with the key only
 * @when it is parsed
 * @then every other setting has its default
 */
TEST(SignerConfLoaderTest, MinimalConfig) {
  auto result = parseSignerConfig(R"({"key": "kms://alias/root"})");
  KMSIGN_ASSERT_RESULT_VALUE(result);
  auto const &config = result.assumeValue();
  EXPECT_EQ(config.key, "kms://alias/root");
  EXPECT_EQ(config.scheme.digest, DigestAlgorithm::kSha256);
  EXPECT_EQ(config.scheme.rsa_padding, RsaPadding::kPss);
  EXPECT_EQ(config.retry.max_attempts, 5u);
  EXPECT_EQ(config.retry.base_delay, 100ms);
  EXPECT_EQ(config.retry.max_delay, 2000ms);
  EXPECT_EQ(config.retry.max_elapsed, 20000ms);
  EXPECT_EQ(config.retry.backoff_factor, 2.0);
  EXPECT_EQ(config.log_level, logger::LogLevel::kInfo);
}

/**
 * @given a configuration setting every member
 * @when it is parsed
 * @then every value is taken over
 */
TEST(SignerConfLoaderTest, FullConfig) {
  auto result = parseSignerConfig(R"({
    "key": "file:///etc/keys/snapshot.pem",
    "digest": "sha384",
    "rsa_padding": "pkcs1v15",
    "log_level": "debug",
    "retry": {
      "max_attempts": 3,
      "base_delay_ms": 50,
      "max_delay_ms": 1000,
      "max_elapsed_ms": 5000,
      "backoff_factor": 1.5
    }
  })");
  KMSIGN_ASSERT_RESULT_VALUE(result);
  auto const &config = result.assumeValue();
  EXPECT_EQ(config.key, "file:///etc/keys/snapshot.pem");
  EXPECT_EQ(config.scheme.digest, DigestAlgorithm::kSha384);
  EXPECT_EQ(config.scheme.rsa_padding, RsaPadding::kPkcs1v15);
  EXPECT_EQ(config.log_level, logger::LogLevel::kDebug);
  EXPECT_EQ(config.retry.max_attempts, 3u);
  EXPECT_EQ(config.retry.base_delay, 50ms);
  EXPECT_EQ(config.retry.max_delay, 1000ms);
  EXPECT_EQ(config.retry.max_elapsed, 5000ms);
  EXPECT_EQ(config.retry.backoff_factor, 1.5);
}

/**
 * @given configurations with a problem
 * @when they are parsed
 * @then the error names the path of the offending value
 */
TEST(SignerConfLoaderTest, ErrorsNameThePath) {
  EXPECT_EQ(parseError(R"({})"), ": required member `key' is missing");
  EXPECT_EQ(parseError(R"({"key": ""})"), "/key: must not be empty");
  EXPECT_EQ(parseError(R"({"key": 7})"), "/key: must be a string");
  EXPECT_EQ(parseError(R"({"key": "kms://k", "colour": "red"})"),
            ": unknown member `colour'");
  EXPECT_EQ(parseError(R"({"key": "kms://k", "digest": "md5"})"),
            "/digest: wrong value `md5': must be one of "
            "`sha256', `sha384', `sha512'");
  EXPECT_EQ(
      parseError(R"({"key": "kms://k", "retry": {"max_attempts": 0}})"),
      "/retry/max_attempts: must be at least 1");
  EXPECT_EQ(
      parseError(R"({"key": "kms://k", "retry": {"max_attempts": -1}})"),
      "/retry/max_attempts: must be an unsigned integer");
  EXPECT_EQ(parseError(
                R"({"key": "kms://k", "retry": {"backoff_factor": 0.5}})"),
            "/retry/backoff_factor: must be at least 1.0");
  EXPECT_EQ(parseError(R"({"key": "kms://k",
                           "retry": {"base_delay_ms": 500,
                                     "max_delay_ms": 100}})"),
            "/retry/max_delay_ms: must not be less than base_delay_ms");
}

/**
 * @given text that is not JSON
 * @when it is parsed
 * @then the error quotes the text near the syntax error
 */
TEST(SignerConfLoaderTest, SyntaxError) {
  auto const error = parseError(R"({"key": "kms://k",,})");
  EXPECT_EQ(error.rfind("JSON parse error", 0), 0u) << error;
}

/**
 * @given a configuration file and a path with no file
 * @when they are loaded
 * @then the file is parsed and the missing one is reported
 */
TEST(SignerConfLoaderTest, LoadFromFile) {
  namespace fs = boost::filesystem;
  auto const dir = fs::temp_directory_path() / fs::unique_path();
  fs::create_directory(dir);
  auto const path = dir / "signer.json";
  {
    std::ofstream out(path.string());
    out << R"({"key": "kms://alias/root", "digest": "sha512"})";
  }

  auto loaded = loadSignerConfig(path.string());
  auto missing = loadSignerConfig((dir / "absent.json").string());
  fs::remove_all(dir);

  KMSIGN_ASSERT_RESULT_VALUE(loaded);
  EXPECT_EQ(loaded.assumeValue().scheme.digest, DigestAlgorithm::kSha512);
  KMSIGN_ASSERT_RESULT_ERROR(missing);
}
