/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_REGISTRY_DEFAULT_SIGNER_REGISTRY_HPP
#define KMSIGN_REGISTRY_DEFAULT_SIGNER_REGISTRY_HPP

#include <memory>

#include "key/signing_algorithm.hpp"
#include "kms/retry_policy.hpp"
#include "logger/logger_manager_fwd.hpp"
#include "registry/signer_registry.hpp"

namespace kmsign {

  namespace kms {
    class KeyManagementClient;
  }

  constexpr char const *kKmsScheme = "kms";
  constexpr char const *kFileScheme = "file";

  /**
   * Registry with the built-in key sources:
   * - "kms://<resource-id>" signs with @a client, registered only if
   *   @a client is set;
   * - "file://<path>" signs with a local PKCS#8 key.
   * @param client - key-management service client shared by all kms signers
   * @param scheme - signing scheme of every signer made by the registry
   * @param retry_policy - for the service calls of kms signers
   * @param log_manager - parent of the registry and signer loggers
   */
  std::unique_ptr<SignerRegistry> makeDefaultSignerRegistry(
      std::shared_ptr<kms::KeyManagementClient> client,
      SigningScheme scheme,
      kms::RetryPolicy retry_policy,
      logger::LoggerManagerTreePtr log_manager);

}  // namespace kmsign

#endif  // KMSIGN_REGISTRY_DEFAULT_SIGNER_REGISTRY_HPP
