/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_LOCAL_FILE_SIGNER_HPP
#define KMSIGN_LOCAL_FILE_SIGNER_HPP

#include "key/signer.hpp"

#include <memory>
#include <string>

#include <boost/filesystem/path.hpp>
#include "key/signing_algorithm.hpp"
#include "logger/logger_fwd.hpp"

namespace Botan {
  class Private_Key;
}

namespace kmsign::local {

  /**
   * FileSigner - signer holding a private key read from a PKCS#8 file, PEM or
   * DER, unencrypted. The key is only read; it is never generated or
   * written.
   */
  class FileSigner : public Signer {
   public:
    /**
     * Load the key and check it can sign under @a scheme.
     * @param path - of the PKCS#8 file
     * @param scheme - fixed for the lifetime of the signer
     * @param log - logger
     * @return the signer, kKeyFormat if the file cannot be read or decoded,
     * kUnsupportedKey or kUnsupportedAlgorithm if the key cannot sign under
     * the scheme
     */
    static expected::Result<std::unique_ptr<FileSigner>, KmsError> create(
        boost::filesystem::path const &path,
        SigningScheme scheme,
        logger::LoggerPtr log);

    ~FileSigner() override;

    expected::Result<Signature, KmsError> sign(
        Bytes const &message, CancellationToken const &cancel) const override;

    expected::Result<Signature, KmsError> signDigest(
        Bytes const &digest, CancellationToken const &cancel) const override;

    expected::Result<std::shared_ptr<const KeyDescriptor>, KmsError> publicKey(
        CancellationToken const &cancel) const override;

    std::string toString() const override;

   private:
    FileSigner(std::unique_ptr<Botan::Private_Key> private_key,
               std::shared_ptr<const KeyDescriptor> descriptor,
               SigningScheme scheme,
               SigningAlgorithm algorithm,
               logger::LoggerPtr log);

    std::unique_ptr<Botan::Private_Key> private_key_;
    std::shared_ptr<const KeyDescriptor> descriptor_;
    SigningScheme scheme_;
    SigningAlgorithm algorithm_;
    logger::LoggerPtr log_;
  };

}  // namespace kmsign::local

#endif  // KMSIGN_LOCAL_FILE_SIGNER_HPP
