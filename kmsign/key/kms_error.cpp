/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/kms_error.hpp"

#include <fmt/core.h>

namespace kmsign {

  char const *toString(KmsErrorCode code) {
    switch (code) {
      case KmsErrorCode::kKeyFormat:
        return "KeyFormatError";
      case KmsErrorCode::kUnsupportedKey:
        return "UnsupportedKeyError";
      case KmsErrorCode::kUnsupportedAlgorithm:
        return "UnsupportedAlgorithmError";
      case KmsErrorCode::kRemoteService:
        return "RemoteServiceError";
      case KmsErrorCode::kInvalidSignatureEncoding:
        return "InvalidSignatureEncodingError";
      case KmsErrorCode::kCancelled:
        return "CancelledError";
      case KmsErrorCode::kUnsupportedScheme:
        return "UnsupportedSchemeError";
    }
    return "UnknownError";
  }

  std::string KmsError::toString() const {
    if (code == KmsErrorCode::kRemoteService) {
      return fmt::format("{}{{transient: {}, exhausted: {}}}: {}",
                         kmsign::toString(code),
                         transient,
                         exhausted,
                         message);
    }
    return fmt::format("{}: {}", kmsign::toString(code), message);
  }

  KmsError KmsError::keyFormat(std::string message) {
    return KmsError{KmsErrorCode::kKeyFormat, std::move(message)};
  }

  KmsError KmsError::unsupportedKey(std::string message) {
    return KmsError{KmsErrorCode::kUnsupportedKey, std::move(message)};
  }

  KmsError KmsError::unsupportedAlgorithm(std::string message) {
    return KmsError{KmsErrorCode::kUnsupportedAlgorithm, std::move(message)};
  }

  KmsError KmsError::remoteService(std::string message,
                                   bool transient,
                                   bool exhausted) {
    return KmsError{
        KmsErrorCode::kRemoteService, std::move(message), transient, exhausted};
  }

  KmsError KmsError::invalidSignatureEncoding(std::string message) {
    return KmsError{KmsErrorCode::kInvalidSignatureEncoding,
                    std::move(message)};
  }

  KmsError KmsError::cancelled(std::string message) {
    return KmsError{KmsErrorCode::kCancelled, std::move(message)};
  }

  KmsError KmsError::unsupportedScheme(std::string message) {
    return KmsError{KmsErrorCode::kUnsupportedScheme, std::move(message)};
  }

}  // namespace kmsign
