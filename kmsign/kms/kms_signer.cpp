/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "kms/kms_signer.hpp"

#include <atomic>

#include <fmt/core.h>
#include "common/result.hpp"
#include "kms/key_descriptor_resolver.hpp"
#include "kms/signing_engine.hpp"
#include "logger/logger.hpp"
#include "key/formatters.hpp"

using namespace kmsign;
using namespace kmsign::kms;
using namespace kmsign::expected;

using DescriptorPtr = std::shared_ptr<const KeyDescriptor>;

KmsSigner::KmsSigner(std::string key_reference,
                     std::shared_ptr<KeyDescriptorResolver> resolver,
                     std::shared_ptr<SigningEngine> engine,
                     logger::LoggerPtr log)
    : key_reference_(std::move(key_reference)),
      resolver_(std::move(resolver)),
      engine_(std::move(engine)),
      log_(std::move(log)) {}

KmsSigner::~KmsSigner() = default;

Result<Signature, KmsError> KmsSigner::sign(
    Bytes const &message, CancellationToken const &cancel) const {
  return publicKey(cancel) | [&](DescriptorPtr descriptor) {
    return engine_->sign(*descriptor, message, cancel);
  };
}

Result<Signature, KmsError> KmsSigner::signDigest(
    Bytes const &digest, CancellationToken const &cancel) const {
  return publicKey(cancel) | [&](DescriptorPtr descriptor) {
    return engine_->signDigest(*descriptor, digest, cancel);
  };
}

Result<DescriptorPtr, KmsError> KmsSigner::publicKey(
    CancellationToken const &cancel) const {
  if (auto cached = std::atomic_load(&descriptor_)) {
    return makeValue(std::move(cached));
  }

  return resolver_->resolve(key_reference_, cancel) |
      [this](KeyDescriptor descriptor) -> DescriptorPtr {
    DescriptorPtr fresh =
        std::make_shared<const KeyDescriptor>(std::move(descriptor));
    DescriptorPtr current;
    if (std::atomic_compare_exchange_strong(&descriptor_, &current, fresh)) {
      return fresh;
    }
    // another caller stored its descriptor first, it has the same key id
    log_->debug("Using concurrently resolved descriptor of '{}'",
                key_reference_);
    return current;
  };
}

std::string KmsSigner::toString() const {
  auto descriptor = std::atomic_load(&descriptor_);
  return fmt::format("KMS signer for '{}' using {}, {}",
                     key_reference_,
                     engine_->scheme().digest,
                     descriptor ? descriptor->toString()
                                : std::string{"public key not fetched yet"});
}
