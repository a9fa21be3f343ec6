/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <iostream>

#include <fmt/core.h>
#include <gflags/gflags.h>
#include "common/cancellation.hpp"
#include "common/files.hpp"
#include "common/hexutils.hpp"
#include "common/result.hpp"
#include "config/signer_conf_literals.hpp"
#include "config/signer_conf_loader.hpp"
#include "logger/logger.hpp"
#include "logger/logger_manager.hpp"
#include "registry/default_signer_registry.hpp"

static bool validateVerbosity(const char *flagname, const std::string &val) {
  if (val.empty()) {
    return true;
  }
  const auto it = config_members::LogLevels.find(val);
  if (it == config_members::LogLevels.end()) {
    std::cerr << "Invalid value for " << flagname << ": should be one of ";
    for (const auto &level : config_members::LogLevels) {
      std::cerr << " '" << level.first << "'";
    }
    std::cerr << "." << std::endl;
    return false;
  }
  return true;
}

static bool validateSingleAction(const char * /*flagname*/,
                                 const std::string &val) {
  static bool got_a_command = false;
  if (got_a_command && not val.empty()) {
    std::cerr << "More than one command specified!";
    return false;
  }
  got_a_command |= not val.empty();
  return true;
}

DEFINE_string(config, "", "Signer configuration file (JSON)");
DEFINE_string(key,
              "",
              "Key reference URI, overrides the key of the configuration");

DEFINE_string(verbosity, "", "Log verbosity, overrides the configuration");
DEFINE_validator(verbosity, &validateVerbosity);

DEFINE_uint64(timeout_ms, 30000, "Deadline of the whole operation");

DEFINE_string(sign_file, "", "Sign the contents of this file");
DEFINE_validator(sign_file, &validateSingleAction);

DEFINE_string(sign_digest, "", "Sign this hex encoded digest");
DEFINE_validator(sign_digest, &validateSingleAction);

DEFINE_bool(public_key, false, "Print the public key of the signing key");

namespace {
  int printSignature(kmsign::Signature const &signature) {
    fmt::print("algorithm: {}\nkey_id: {}\nsignature: {}\n",
               kmsign::toString(signature.algorithm),
               signature.key_id_hex,
               kmsign::bytesToHexstring(signature.bytes));
    return EXIT_SUCCESS;
  }
}  // namespace

int main(int argc, char **argv) {
  gflags::SetUsageMessage(
      "Sign data with a key named by a key reference URI, e.g.\n"
      "  kmsign_tool --key file:///etc/keys/root.pem --sign_file root.json");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  kmsign::SignerConfig config;
  if (not FLAGS_config.empty()) {
    auto loaded = kmsign::loadSignerConfig(FLAGS_config);
    if (auto error = kmsign::expected::resultToOptionalError(loaded)) {
      std::cerr << "Failed reading the configuration: " << *error
                << std::endl;
      return EXIT_FAILURE;
    }
    config = std::move(loaded).assumeValue();
  }
  if (not FLAGS_key.empty()) {
    config.key = FLAGS_key;
  }
  if (not FLAGS_verbosity.empty()) {
    config.log_level = config_members::LogLevels.at(FLAGS_verbosity);
  }

  logger::LoggerConfig log_config;
  log_config.log_level = config.log_level;
  logger::LoggerManagerTreePtr log_manager =
      std::make_shared<logger::LoggerManagerTree>(std::move(log_config))
          ->getChild("Tool");
  logger::LoggerPtr log = log_manager->getLogger();
  log->debug("Log level {}, retry {}", config.log_level, config.retry);

  if (config.key.empty()) {
    log->error("No key given, use --key or --config");
    ::gflags::ShowUsageWithFlags(argv[0]);
    return EXIT_FAILURE;
  }

  // the service transport is supplied by the host application, so only the
  // local key sources are available here
  auto registry = kmsign::makeDefaultSignerRegistry(
      nullptr, config.scheme, config.retry, log_manager);
  auto made = registry->makeSigner(config.key);
  if (auto error = kmsign::expected::resultToOptionalError(made)) {
    log->error("Could not create a signer for '{}': {}", config.key, *error);
    return EXIT_FAILURE;
  }
  auto const signer = std::move(made).assumeValue();

  auto cancel = kmsign::CancellationToken::withTimeout(
      std::chrono::milliseconds(FLAGS_timeout_ms));

  if (FLAGS_public_key) {
    auto descriptor = signer->publicKey(*cancel);
    if (auto error = kmsign::expected::resultToOptionalError(descriptor)) {
      log->error("{}", *error);
      return EXIT_FAILURE;
    }
    fmt::print("{}\npublic_key: {}\n",
               descriptor.assumeValue()->toString(),
               kmsign::bytesToHexstring(
                   descriptor.assumeValue()->public_key_der));
  }

  if (not FLAGS_sign_file.empty()) {
    auto data = kmsign::readBinaryFile(FLAGS_sign_file);
    if (auto error = kmsign::expected::resultToOptionalError(data)) {
      log->error("{}", *error);
      return EXIT_FAILURE;
    }
    return signer->sign(data.assumeValue(), *cancel)
        .match([](auto const &v) { return printSignature(v.value); },
               [&log](auto const &e) {
                 log->error("{}", e.error);
                 return EXIT_FAILURE;
               });
  }

  if (not FLAGS_sign_digest.empty()) {
    auto digest = kmsign::hexstringToBytesResult(FLAGS_sign_digest);
    if (auto error = kmsign::expected::resultToOptionalError(digest)) {
      log->error("Bad digest: {}", *error);
      return EXIT_FAILURE;
    }
    return signer->signDigest(digest.assumeValue(), *cancel)
        .match([](auto const &v) { return printSignature(v.value); },
               [&log](auto const &e) {
                 log->error("{}", e.error);
                 return EXIT_FAILURE;
               });
  }

  if (not FLAGS_public_key) {
    log->error("No command specified!");
    ::gflags::ShowUsageWithFlags(argv[0]);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
