/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KMS_KEY_DESCRIPTOR_RESOLVER_HPP
#define KMSIGN_KMS_KEY_DESCRIPTOR_RESOLVER_HPP

#include <memory>
#include <string>

#include "common/result_fwd.hpp"
#include "key/key_descriptor.hpp"
#include "key/kms_error.hpp"
#include "kms/retry_policy.hpp"
#include "logger/logger_fwd.hpp"

namespace kmsign {
  class CancellationToken;
}

namespace kmsign::kms {

  class KeyManagementClient;

  /// Fetches and classifies the public key of a remote key
  class KeyDescriptorResolver {
   public:
    KeyDescriptorResolver(std::shared_ptr<KeyManagementClient> client,
                          RetryPolicy retry_policy,
                          JitterSource jitter,
                          logger::LoggerPtr log);

    /**
     * Fetch the public key of @a key_reference and build its descriptor.
     * Every call fetches again; caching is up to the caller.
     * @return descriptor, or the error of the fetch, decoding or
     * classification
     */
    expected::Result<KeyDescriptor, KmsError> resolve(
        std::string const &key_reference,
        CancellationToken const &cancel) const;

   private:
    std::shared_ptr<KeyManagementClient> client_;
    RetryPolicy retry_policy_;
    JitterSource jitter_;
    logger::LoggerPtr log_;
  };

}  // namespace kmsign::kms

#endif  // KMSIGN_KMS_KEY_DESCRIPTOR_RESOLVER_HPP
