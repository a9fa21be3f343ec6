/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/default_signer_registry.hpp"

#include "common/result.hpp"
#include "kms/key_descriptor_resolver.hpp"
#include "kms/key_management_client.hpp"
#include "kms/kms_signer.hpp"
#include "kms/signing_engine.hpp"
#include "local/file_signer.hpp"
#include "logger/logger_manager.hpp"

using namespace kmsign;
using namespace kmsign::expected;

std::unique_ptr<SignerRegistry> kmsign::makeDefaultSignerRegistry(
    std::shared_ptr<kms::KeyManagementClient> client,
    SigningScheme scheme,
    kms::RetryPolicy retry_policy,
    logger::LoggerManagerTreePtr log_manager) {
  auto registry = std::make_unique<SignerRegistry>(
      log_manager->getChild("Registry")->getLogger());

  if (client) {
    auto kms_log_manager = log_manager->getChild("Kms");
    auto engine = std::make_shared<kms::SigningEngine>(
        client,
        scheme,
        retry_policy,
        kms::makeDefaultJitterSource(),
        kms_log_manager->getChild("SigningEngine")->getLogger());
    auto resolver = std::make_shared<kms::KeyDescriptorResolver>(
        client,
        retry_policy,
        kms::makeDefaultJitterSource(),
        kms_log_manager->getChild("Resolver")->getLogger());
    auto signer_log = kms_log_manager->getChild("KmsSigner")->getLogger();

    registry->registerScheme(
        kKmsScheme,
        [engine, resolver, signer_log](KeyReferenceUri const &uri)
            -> Result<std::unique_ptr<Signer>, KmsError> {
          std::unique_ptr<Signer> signer = std::make_unique<kms::KmsSigner>(
              uri.location, resolver, engine, signer_log);
          return makeValue(std::move(signer));
        });
  }

  auto file_log = log_manager->getChild("FileSigner")->getLogger();
  registry->registerScheme(
      kFileScheme,
      [scheme, file_log](KeyReferenceUri const &uri)
          -> Result<std::unique_ptr<Signer>, KmsError> {
        return local::FileSigner::create(uri.location, scheme, file_log) |
            [](auto signer) -> std::unique_ptr<Signer> { return signer; };
      });

  return registry;
}
