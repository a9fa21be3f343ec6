/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KMS_KEY_MANAGEMENT_CLIENT_HPP
#define KMSIGN_KMS_KEY_MANAGEMENT_CLIENT_HPP

#include <string>
#include <vector>

#include "common/result_fwd.hpp"
#include "key/key_descriptor.hpp"
#include "key/signing_algorithm.hpp"

namespace kmsign {
  class CancellationToken;
}

namespace kmsign::kms {

  enum class ServiceErrorKind {
    /// throttling, timeouts, 5xx: may succeed if repeated
    kTransient,
    /// authorization failure, missing key, bad request: will not succeed
    kPermanent,
  };

  /// Failure reported by the key-management service client
  struct ServiceError {
    ServiceErrorKind kind;
    std::string message;

    bool isTransient() const {
      return kind == ServiceErrorKind::kTransient;
    }

    std::string toString() const;

    static ServiceError transient(std::string message);
    static ServiceError permanent(std::string message);
  };

  struct PublicKeyResponse {
    /// DER SubjectPublicKeyInfo
    Bytes public_key_der;
    /// service identifiers, e.g. "RSASSA_PSS_SHA_256"
    std::vector<std::string> signing_algorithms;
  };

  /// A single sign call. Built fresh for every call and never reused.
  struct SignRequest {
    std::string key_reference;
    Bytes digest;
    SigningAlgorithm algorithm;
  };

  /**
   * Client of the remote key-management service. Implementations own
   * credentials and transport; they must honour @a cancel by aborting the
   * in-flight call where the transport allows it.
   */
  class KeyManagementClient {
   public:
    virtual ~KeyManagementClient() = default;

    virtual expected::Result<PublicKeyResponse, ServiceError> getPublicKey(
        std::string const &resource_id,
        CancellationToken const &cancel) const = 0;

    /// @return raw signature bytes; the service signs the digest as is
    virtual expected::Result<Bytes, ServiceError> sign(
        SignRequest const &request, CancellationToken const &cancel) const = 0;
  };

}  // namespace kmsign::kms

#endif  // KMSIGN_KMS_KEY_MANAGEMENT_CLIENT_HPP
