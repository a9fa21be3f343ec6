/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KMS_KMS_SIGNER_HPP
#define KMSIGN_KMS_KMS_SIGNER_HPP

#include "key/signer.hpp"

#include <memory>
#include <string>

#include "logger/logger_fwd.hpp"

namespace kmsign::kms {

  class KeyDescriptorResolver;
  class SigningEngine;

  /**
   * KmsSigner - signer whose private key stays in the remote key-management
   * service. The key descriptor is fetched on first use and kept for the
   * lifetime of the signer.
   */
  class KmsSigner : public Signer {
   public:
    KmsSigner(std::string key_reference,
              std::shared_ptr<KeyDescriptorResolver> resolver,
              std::shared_ptr<SigningEngine> engine,
              logger::LoggerPtr log);

    ~KmsSigner() override;

    expected::Result<Signature, KmsError> sign(
        Bytes const &message, CancellationToken const &cancel) const override;

    expected::Result<Signature, KmsError> signDigest(
        Bytes const &digest, CancellationToken const &cancel) const override;

    expected::Result<std::shared_ptr<const KeyDescriptor>, KmsError> publicKey(
        CancellationToken const &cancel) const override;

    std::string toString() const override;

   private:
    std::string key_reference_;
    std::shared_ptr<KeyDescriptorResolver> resolver_;
    std::shared_ptr<SigningEngine> engine_;
    logger::LoggerPtr log_;

    /// set once by the first successful fetch, accessed atomically
    mutable std::shared_ptr<const KeyDescriptor> descriptor_;
  };

}  // namespace kmsign::kms

#endif  // KMSIGN_KMS_KMS_SIGNER_HPP
