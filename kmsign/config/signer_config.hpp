/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_CONFIG_SIGNER_CONFIG_HPP
#define KMSIGN_CONFIG_SIGNER_CONFIG_HPP

#include <string>

#include "key/signing_algorithm.hpp"
#include "kms/retry_policy.hpp"
#include "logger/logger.hpp"

namespace kmsign {

  struct SignerConfig {
    /// key reference URI, e.g. "kms://alias/metadata-root"
    std::string key;
    SigningScheme scheme;
    kms::RetryPolicy retry;
    logger::LogLevel log_level{logger::kDefaultLogLevel};
  };

}  // namespace kmsign

#endif  // KMSIGN_CONFIG_SIGNER_CONFIG_HPP
