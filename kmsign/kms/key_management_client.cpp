/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "kms/key_management_client.hpp"

#include <fmt/core.h>

using namespace kmsign::kms;

std::string ServiceError::toString() const {
  return fmt::format("{} service error: {}",
                     isTransient() ? "transient" : "permanent",
                     message);
}

ServiceError ServiceError::transient(std::string message) {
  return ServiceError{ServiceErrorKind::kTransient, std::move(message)};
}

ServiceError ServiceError::permanent(std::string message) {
  return ServiceError{ServiceErrorKind::kPermanent, std::move(message)};
}
