/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/files.hpp"

#include <ciso646>
#include <fstream>
#include <iterator>

#include <fmt/core.h>
#include "common/result.hpp"

namespace {
  template <typename T>
  kmsign::expected::Result<T, std::string> readFile(
      const boost::filesystem::path &path, std::ios_base::openmode mode) {
    std::ifstream file(path.string(), mode);
    if (not file) {
      return kmsign::expected::makeError(
          fmt::format("File '{}' could not be read.", path.string()));
    }

    T contents((std::istreambuf_iterator<char>(file)),
               std::istreambuf_iterator<char>());
    return kmsign::expected::makeValue(std::move(contents));
  }
}  // namespace

kmsign::expected::Result<std::string, std::string> kmsign::readTextFile(
    const boost::filesystem::path &path) {
  return readFile<std::string>(path, std::ios_base::in);
}

kmsign::expected::Result<std::vector<uint8_t>, std::string>
kmsign::readBinaryFile(const boost::filesystem::path &path) {
  return readFile<std::vector<uint8_t>>(
      path, std::ios_base::binary | std::ios_base::in);
}
