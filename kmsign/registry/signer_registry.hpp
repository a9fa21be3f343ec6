/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_REGISTRY_SIGNER_REGISTRY_HPP
#define KMSIGN_REGISTRY_SIGNER_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "common/result_fwd.hpp"
#include "key/kms_error.hpp"
#include "key/signer.hpp"
#include "logger/logger_fwd.hpp"
#include "registry/key_reference_uri.hpp"

namespace kmsign {

  /**
   * Maps key reference URI schemes to the factories of their signers.
   */
  class SignerRegistry {
   public:
    using SignerFactory =
        std::function<expected::Result<std::unique_ptr<Signer>, KmsError>(
            KeyReferenceUri const &)>;

    explicit SignerRegistry(logger::LoggerPtr log);

    /**
     * Register a factory for a scheme, replacing any previous one.
     * @param scheme - matched case-insensitively
     */
    void registerScheme(std::string scheme, SignerFactory factory);

    bool isSchemeSupported(std::string_view scheme) const;

    /// @return registered schemes, lowercase and sorted
    std::vector<std::string> getSupportedSchemes() const;

    /**
     * Construct the signer for a key reference URI.
     * @return the signer; kUnsupportedScheme if the URI is malformed or its
     * scheme is not registered; otherwise whatever the factory reports
     */
    expected::Result<std::unique_ptr<Signer>, KmsError> makeSigner(
        std::string_view uri) const;

   private:
    std::map<std::string, SignerFactory> factories_;
    logger::LoggerPtr log_;
  };

}  // namespace kmsign

#endif  // KMSIGN_REGISTRY_SIGNER_REGISTRY_HPP
