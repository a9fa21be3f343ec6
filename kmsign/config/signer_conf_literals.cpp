/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/signer_conf_literals.hpp"

namespace config_members {
  const char *Key = "key";
  const char *Digest = "digest";
  const char *RsaPadding = "rsa_padding";
  const char *LogLevel = "log_level";
  const char *Retry = "retry";
  const char *MaxAttempts = "max_attempts";
  const char *BaseDelayMs = "base_delay_ms";
  const char *MaxDelayMs = "max_delay_ms";
  const char *MaxElapsedMs = "max_elapsed_ms";
  const char *BackoffFactor = "backoff_factor";
  const std::map<std::string, logger::LogLevel> LogLevels{
      {"trace", logger::LogLevel::kTrace},
      {"debug", logger::LogLevel::kDebug},
      {"info", logger::LogLevel::kInfo},
      {"warning", logger::LogLevel::kWarn},
      {"error", logger::LogLevel::kError},
      {"critical", logger::LogLevel::kCritical}};
  const std::map<std::string, kmsign::DigestAlgorithm> Digests{
      {"sha256", kmsign::DigestAlgorithm::kSha256},
      {"sha384", kmsign::DigestAlgorithm::kSha384},
      {"sha512", kmsign::DigestAlgorithm::kSha512}};
  const std::map<std::string, kmsign::RsaPadding> RsaPaddings{
      {"pss", kmsign::RsaPadding::kPss},
      {"pkcs1v15", kmsign::RsaPadding::kPkcs1v15}};
}  // namespace config_members
