/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_CONFIG_SIGNER_CONF_LITERALS_HPP
#define KMSIGN_CONFIG_SIGNER_CONF_LITERALS_HPP

#include <map>
#include <string>

#include "key/signing_algorithm.hpp"
#include "logger/logger.hpp"

namespace config_members {
  extern const char *Key;
  extern const char *Digest;
  extern const char *RsaPadding;
  extern const char *LogLevel;
  extern const char *Retry;
  extern const char *MaxAttempts;
  extern const char *BaseDelayMs;
  extern const char *MaxDelayMs;
  extern const char *MaxElapsedMs;
  extern const char *BackoffFactor;
  extern const std::map<std::string, logger::LogLevel> LogLevels;
  extern const std::map<std::string, kmsign::DigestAlgorithm> Digests;
  extern const std::map<std::string, kmsign::RsaPadding> RsaPaddings;
}  // namespace config_members

#endif  // KMSIGN_CONFIG_SIGNER_CONF_LITERALS_HPP
