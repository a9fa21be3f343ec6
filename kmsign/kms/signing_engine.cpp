/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "kms/signing_engine.hpp"

#include <fmt/core.h>
#include "common/result.hpp"
#include "key/algorithm_selection.hpp"
#include "key/digest.hpp"
#include "kms/key_management_client.hpp"
#include "kms/retry.hpp"
#include "logger/logger.hpp"
#include "key/formatters.hpp"

using namespace kmsign;
using namespace kmsign::kms;
using namespace kmsign::expected;

SigningEngine::SigningEngine(std::shared_ptr<KeyManagementClient> client,
                             SigningScheme scheme,
                             RetryPolicy retry_policy,
                             JitterSource jitter,
                             logger::LoggerPtr log)
    : client_(std::move(client)),
      scheme_(scheme),
      retry_policy_(std::move(retry_policy)),
      jitter_(std::move(jitter)),
      log_(std::move(log)) {}

Result<Signature, KmsError> SigningEngine::sign(
    KeyDescriptor const &descriptor,
    Bytes const &message,
    CancellationToken const &cancel) const {
  return signDigest(
      descriptor, computeDigest(scheme_.digest, message), cancel);
}

Result<Signature, KmsError> SigningEngine::signDigest(
    KeyDescriptor const &descriptor,
    Bytes const &digest,
    CancellationToken const &cancel) const {
  auto selected = selectAlgorithm(descriptor, scheme_);
  if (auto error = resultToOptionalError(selected)) {
    log_->error("{}", *error);
    return makeError(std::move(*error));
  }
  auto const algorithm = selected.assumeValue();

  if (auto error = resultToOptionalError(
          checkDigestLength(descriptor, algorithm, digest))) {
    log_->error("{}", *error);
    return makeError(std::move(*error));
  }

  auto const operation =
      fmt::format("Sign with '{}' using {}",
                  descriptor.key_reference,
                  algorithm);
  auto signed_bytes =
      callWithRetry(retry_policy_, jitter_, cancel, log_, operation, [&] {
        return client_->sign(
            SignRequest{descriptor.key_reference, digest, algorithm}, cancel);
      });

  return std::move(signed_bytes) |
      [&](Bytes bytes) -> Result<Signature, KmsError> {
    if (auto error =
            resultToOptionalError(validateSignatureEncoding(
                descriptor, algorithm, bytes))) {
      log_->error("{}", *error);
      return makeError(std::move(*error));
    }
    log_->debug("{} produced a {} byte signature", operation, bytes.size());
    return makeValue(
        Signature{std::move(bytes), algorithm, descriptor.keyIdHex()});
  };
}

SigningScheme const &SigningEngine::scheme() const {
  return scheme_;
}
