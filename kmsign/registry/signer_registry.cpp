/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/signer_registry.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/range/adaptor/map.hpp>
#include <fmt/core.h>
#include "common/result.hpp"
#include "logger/logger.hpp"

using namespace kmsign;
using namespace kmsign::expected;

SignerRegistry::SignerRegistry(logger::LoggerPtr log) : log_(std::move(log)) {}

void SignerRegistry::registerScheme(std::string scheme,
                                    SignerFactory factory) {
  boost::algorithm::to_lower(scheme);
  log_->debug("Registering signer factory for scheme '{}'", scheme);
  factories_[std::move(scheme)] = std::move(factory);
}

bool SignerRegistry::isSchemeSupported(std::string_view scheme) const {
  return factories_.count(boost::algorithm::to_lower_copy(std::string{scheme}))
      > 0;
}

std::vector<std::string> SignerRegistry::getSupportedSchemes() const {
  auto keys = factories_ | boost::adaptors::map_keys;
  return std::vector<std::string>(keys.begin(), keys.end());
}

Result<std::unique_ptr<Signer>, KmsError> SignerRegistry::makeSigner(
    std::string_view uri) const {
  auto parsed = KeyReferenceUri::parse(uri);
  if (auto error = resultToOptionalError(parsed)) {
    log_->error("{}", *error);
    return makeError(std::move(*error));
  }
  auto const &reference = parsed.assumeValue();

  auto it = factories_.find(reference.scheme);
  if (it == factories_.end()) {
    auto error = KmsError::unsupportedScheme(
        fmt::format("no signer for scheme '{}' of '{}', supported: {}",
                    reference.scheme,
                    uri,
                    boost::algorithm::join(getSupportedSchemes(), ", ")));
    log_->error("{}", error);
    return makeError(std::move(error));
  }

  auto signer = it->second(reference);
  if (auto error = resultToOptionalError(signer)) {
    log_->error("Could not create signer for '{}': {}", uri, *error);
  } else {
    log_->info("Created {}", signer.assumeValue()->toString());
  }
  return signer;
}
