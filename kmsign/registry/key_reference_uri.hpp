/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_REGISTRY_KEY_REFERENCE_URI_HPP
#define KMSIGN_REGISTRY_KEY_REFERENCE_URI_HPP

#include <string>
#include <string_view>

#include "common/result_fwd.hpp"
#include "key/kms_error.hpp"

namespace kmsign {

  /// A key reference of the form "<scheme>://<location>"
  struct KeyReferenceUri {
    /// lowercase
    std::string scheme;
    /// everything after "://", as given
    std::string location;

    std::string toString() const;

    /**
     * @return the parsed URI, or kUnsupportedScheme if @a uri has no scheme
     * or an empty location
     */
    static expected::Result<KeyReferenceUri, KmsError> parse(
        std::string_view uri);
  };

}  // namespace kmsign

#endif  // KMSIGN_REGISTRY_KEY_REFERENCE_URI_HPP
