/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KEY_KMS_ERROR_HPP
#define KMSIGN_KEY_KMS_ERROR_HPP

#include <string>

namespace kmsign {

  enum class KmsErrorCode {
    /// remote public key cannot be decoded
    kKeyFormat,
    /// key size or curve has no signing algorithm
    kUnsupportedKey,
    /// key and digest combination has no signing algorithm
    kUnsupportedAlgorithm,
    /// the key-management service call failed
    kRemoteService,
    /// the returned signature is malformed
    kInvalidSignatureEncoding,
    /// the caller aborted the operation
    kCancelled,
    /// the key reference URI scheme has no signer
    kUnsupportedScheme,
  };

  char const *toString(KmsErrorCode code);

  /**
   * Failure of a signer operation. Messages name key references and
   * algorithms only, never digests, signatures or key material.
   */
  struct KmsError {
    KmsErrorCode code;
    std::string message;
    /// for kRemoteService: whether the last failure was transient
    bool transient{false};
    /// for kRemoteService: whether the retry budget was used up
    bool exhausted{false};

    std::string toString() const;

    static KmsError keyFormat(std::string message);
    static KmsError unsupportedKey(std::string message);
    static KmsError unsupportedAlgorithm(std::string message);
    static KmsError remoteService(std::string message,
                                  bool transient,
                                  bool exhausted);
    static KmsError invalidSignatureEncoding(std::string message);
    static KmsError cancelled(std::string message);
    static KmsError unsupportedScheme(std::string message);
  };

}  // namespace kmsign

#endif  // KMSIGN_KEY_KMS_ERROR_HPP
