/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KMS_SIGNING_ENGINE_HPP
#define KMSIGN_KMS_SIGNING_ENGINE_HPP

#include <memory>

#include "common/result_fwd.hpp"
#include "key/key_descriptor.hpp"
#include "key/kms_error.hpp"
#include "key/signature.hpp"
#include "key/signing_algorithm.hpp"
#include "kms/retry_policy.hpp"
#include "logger/logger_fwd.hpp"

namespace kmsign {
  class CancellationToken;
}

namespace kmsign::kms {

  class KeyManagementClient;

  /**
   * Turns digests into validated signatures by calling the remote sign
   * operation with the algorithm selected for the key and the scheme.
   */
  class SigningEngine {
   public:
    SigningEngine(std::shared_ptr<KeyManagementClient> client,
                  SigningScheme scheme,
                  RetryPolicy retry_policy,
                  JitterSource jitter,
                  logger::LoggerPtr log);

    /// Hash @a message with the scheme's digest and sign the digest
    expected::Result<Signature, KmsError> sign(
        KeyDescriptor const &descriptor,
        Bytes const &message,
        CancellationToken const &cancel) const;

    /**
     * Sign a digest computed by the caller. Fails with kUnsupportedAlgorithm
     * before any service call if the key has no algorithm for the scheme or
     * the digest length does not match.
     */
    expected::Result<Signature, KmsError> signDigest(
        KeyDescriptor const &descriptor,
        Bytes const &digest,
        CancellationToken const &cancel) const;

    SigningScheme const &scheme() const;

   private:
    std::shared_ptr<KeyManagementClient> client_;
    SigningScheme scheme_;
    RetryPolicy retry_policy_;
    JitterSource jitter_;
    logger::LoggerPtr log_;
  };

}  // namespace kmsign::kms

#endif  // KMSIGN_KMS_SIGNING_ENGINE_HPP
