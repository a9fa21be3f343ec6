/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "local/file_signer.hpp"

#include <botan/auto_rng.h>
#include <botan/data_src.h>
#include <botan/exceptn.h>
#include <botan/pk_keys.h>
#include <botan/pkcs8.h>
#include <botan/pubkey.h>
#include <fmt/core.h>
#include "common/cancellation.hpp"
#include "common/files.hpp"
#include "common/result.hpp"
#include "key/algorithm_identifier.hpp"
#include "key/algorithm_selection.hpp"
#include "key/digest.hpp"
#include "key/formatters.hpp"
#include "logger/logger.hpp"

using namespace kmsign;
using namespace kmsign::local;
using namespace kmsign::expected;

Result<std::unique_ptr<FileSigner>, KmsError> FileSigner::create(
    boost::filesystem::path const &path,
    SigningScheme scheme,
    logger::LoggerPtr log) {
  auto contents = readBinaryFile(path);
  if (auto error = resultToOptionalError(contents)) {
    return makeError(KmsError::keyFormat(*error));
  }

  std::unique_ptr<Botan::Private_Key> private_key;
  Bytes public_key_der;
  try {
    Botan::DataSource_Memory source(contents.assumeValue());
    private_key = Botan::PKCS8::load_key(source);
    public_key_der = private_key->subject_public_key();
  } catch (Botan::Exception const &e) {
    return makeError(KmsError::keyFormat(
        fmt::format("'{}' is not an unencrypted PKCS#8 private key: {}",
                    path.string(),
                    e)));
  }

  auto described = describePublicKey(path.string(), public_key_der, {});
  if (auto error = resultToOptionalError(described)) {
    return makeError(std::move(*error));
  }
  auto descriptor = std::move(described).assumeValue();
  descriptor.supported_algorithms =
      getAlgorithmsForKey(descriptor.algorithm_family, descriptor.curve);

  auto selected = selectAlgorithm(descriptor, scheme);
  if (auto error = resultToOptionalError(selected)) {
    return makeError(std::move(*error));
  }

  log->info("Loaded {}", descriptor);
  auto shared_descriptor =
      std::make_shared<const KeyDescriptor>(std::move(descriptor));
  // the constructor is private, so make_unique cannot reach it
  return makeValue(std::unique_ptr<FileSigner>(
      new FileSigner(std::move(private_key),
                     std::move(shared_descriptor),
                     scheme,
                     selected.assumeValue(),
                     std::move(log))));
}

FileSigner::FileSigner(std::unique_ptr<Botan::Private_Key> private_key,
                       std::shared_ptr<const KeyDescriptor> descriptor,
                       SigningScheme scheme,
                       SigningAlgorithm algorithm,
                       logger::LoggerPtr log)
    : private_key_(std::move(private_key)),
      descriptor_(std::move(descriptor)),
      scheme_(scheme),
      algorithm_(algorithm),
      log_(std::move(log)) {}

FileSigner::~FileSigner() = default;

Result<Signature, KmsError> FileSigner::sign(
    Bytes const &message, CancellationToken const &cancel) const {
  return signDigest(computeDigest(scheme_.digest, message), cancel);
}

Result<Signature, KmsError> FileSigner::signDigest(
    Bytes const &digest, CancellationToken const &cancel) const {
  if (cancel.isCancelled()) {
    return makeError(KmsError::cancelled(
        fmt::format("Sign with '{}' cancelled", descriptor_->key_reference)));
  }
  if (auto error = resultToOptionalError(
          checkDigestLength(*descriptor_, algorithm_, digest))) {
    return makeError(std::move(*error));
  }

  Bytes bytes;
  try {
    Botan::AutoSeeded_RNG rng;
    Botan::PK_Signer signer(*private_key_,
                            rng,
                            getDigestEmsaName(algorithm_),
                            getSignatureFormat(algorithm_));
    bytes = signer.sign_message(digest, rng);
  } catch (Botan::Exception const &e) {
    log_->error("Sign with '{}' failed: {}", descriptor_->key_reference, e);
    return makeError(KmsError::unsupportedAlgorithm(
        fmt::format("Sign with '{}' using {} failed: {}",
                    descriptor_->key_reference,
                    algorithm_,
                    e)));
  }

  if (auto error = resultToOptionalError(
          validateSignatureEncoding(*descriptor_, algorithm_, bytes))) {
    return makeError(std::move(*error));
  }
  return makeValue(
      Signature{std::move(bytes), algorithm_, descriptor_->keyIdHex()});
}

Result<std::shared_ptr<const KeyDescriptor>, KmsError> FileSigner::publicKey(
    CancellationToken const &) const {
  return makeValue(descriptor_);
}

std::string FileSigner::toString() const {
  return fmt::format("File signer using {}, {}",
                     algorithm_,
                     descriptor_->toString());
}
