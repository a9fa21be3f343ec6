/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "kms/key_descriptor_resolver.hpp"

#include <fmt/core.h>
#include "common/result.hpp"
#include "kms/key_management_client.hpp"
#include "kms/retry.hpp"
#include "logger/logger.hpp"

using namespace kmsign;
using namespace kmsign::kms;
using namespace kmsign::expected;

KeyDescriptorResolver::KeyDescriptorResolver(
    std::shared_ptr<KeyManagementClient> client,
    RetryPolicy retry_policy,
    JitterSource jitter,
    logger::LoggerPtr log)
    : client_(std::move(client)),
      retry_policy_(std::move(retry_policy)),
      jitter_(std::move(jitter)),
      log_(std::move(log)) {}

Result<KeyDescriptor, KmsError> KeyDescriptorResolver::resolve(
    std::string const &key_reference, CancellationToken const &cancel) const {
  auto fetched = callWithRetry(
      retry_policy_,
      jitter_,
      cancel,
      log_,
      fmt::format("GetPublicKey of '{}'", key_reference),
      [&] { return client_->getPublicKey(key_reference, cancel); });

  return std::move(fetched) |
      [&](PublicKeyResponse response) -> Result<KeyDescriptor, KmsError> {
    std::vector<SigningAlgorithm> algorithms;
    for (auto const &name : response.signing_algorithms) {
      if (auto algorithm = signingAlgorithmFromString(name)) {
        algorithms.push_back(*algorithm);
      } else {
        log_->debug("Ignoring unknown signing algorithm {} of key '{}'",
                    name,
                    key_reference);
      }
    }

    auto descriptor = describePublicKey(
        key_reference, response.public_key_der, std::move(algorithms));
    if (auto error = resultToOptionalError(descriptor)) {
      log_->error(
          "Could not use public key of '{}': {}", key_reference, *error);
    } else {
      log_->info("Resolved {}", descriptor.assumeValue());
    }
    return descriptor;
  };
}
