/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_CONFIG_SIGNER_CONF_LOADER_HPP
#define KMSIGN_CONFIG_SIGNER_CONF_LOADER_HPP

#include <string>

#include "common/result_fwd.hpp"
#include "config/signer_config.hpp"

namespace kmsign {

  /**
   * Parse a signer configuration from JSON text.
   * @param json - the configuration document
   * @return the configuration, or a description of the first problem found,
   * naming its path in the document
   */
  expected::Result<SignerConfig, std::string> parseSignerConfig(
      std::string const &json);

  /// Read the file at @a path and parse it with parseSignerConfig()
  expected::Result<SignerConfig, std::string> loadSignerConfig(
      std::string const &path);

}  // namespace kmsign

#endif  // KMSIGN_CONFIG_SIGNER_CONF_LOADER_HPP
