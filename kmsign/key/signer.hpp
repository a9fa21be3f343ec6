/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KEY_SIGNER_HPP
#define KMSIGN_KEY_SIGNER_HPP

#include <memory>
#include <string>

#include "common/result_fwd.hpp"
#include "key/key_descriptor.hpp"
#include "key/kms_error.hpp"
#include "key/signature.hpp"

namespace kmsign {

  class CancellationToken;

  /**
   * Signer - a signing key held by some key source. Implementations are
   * selected by the scheme of the key reference URI.
   */
  class Signer {
   public:
    virtual ~Signer() = default;

    /**
     * Sign a message. The message is hashed with the digest algorithm of the
     * signer's scheme before the private key operation.
     * @param message - data to sign
     * @param cancel - aborts the operation and any pending retry
     * @return validated signature or the reason there is none
     */
    virtual expected::Result<Signature, KmsError> sign(
        Bytes const &message, CancellationToken const &cancel) const = 0;

    /**
     * Sign a digest that was computed by the caller.
     * @param digest - must have the length of the scheme's digest algorithm
     * @param cancel - aborts the operation and any pending retry
     */
    virtual expected::Result<Signature, KmsError> signDigest(
        Bytes const &digest, CancellationToken const &cancel) const = 0;

    /// @return descriptor of the public key, fetched on first use
    virtual expected::Result<std::shared_ptr<const KeyDescriptor>, KmsError>
    publicKey(CancellationToken const &cancel) const = 0;

    virtual std::string toString() const = 0;
  };

}  // namespace kmsign

#endif  // KMSIGN_KEY_SIGNER_HPP
