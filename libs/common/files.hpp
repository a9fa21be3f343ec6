/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_FILES_HPP
#define KMSIGN_FILES_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include "common/result_fwd.hpp"

/**
 * This source file contains common methods related to files
 */
namespace kmsign {

  /**
   * Read file in text mode, and either return its contents as a string
   * or return the error as a string
   * @param path - path to the file
   */
  expected::Result<std::string, std::string> readTextFile(
      const boost::filesystem::path &path);

  /**
   * Read file in binary mode, and either return its contents as a byte vector
   * or return the error as a string
   * @param path - path to the file
   */
  expected::Result<std::vector<uint8_t>, std::string> readBinaryFile(
      const boost::filesystem::path &path);
}  // namespace kmsign
#endif  // KMSIGN_FILES_HPP
