/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
#ifndef KMSIGN_HEXUTILS_HPP
#define KMSIGN_HEXUTILS_HPP

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include <boost/algorithm/hex.hpp>
#include "common/result.hpp"

namespace kmsign {

  /**
   * Convert raw bytes to printable lowercase hex string
   * @param bytes - raw bytes to convert
   * @return - converted hex string
   */
  inline std::string bytesToHexstring(const std::vector<uint8_t> &bytes) {
    std::string result;
    result.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(result));
    return result;
  }

  /**
   * Convert printable hex string to raw bytes
   * @param str - hex string to convert
   * @return - raw bytes or an error if provided string was not a correct hex
   * string
   */
  inline expected::Result<std::vector<uint8_t>, std::string>
  hexstringToBytesResult(std::string_view str) {
    using namespace kmsign::expected;
    if (str.size() % 2 != 0) {
      return makeError(
          std::string{"Hex string contains uneven number of characters."});
    }
    std::vector<uint8_t> result;
    result.reserve(str.size() / 2);
    try {
      boost::algorithm::unhex(
          str.begin(), str.end(), std::back_inserter(result));
    } catch (const boost::algorithm::hex_decode_error &) {
      return makeError(std::string{"Not a hex string."});
    }
    return makeValue(std::move(result));
  }

}  // namespace kmsign

#endif  // KMSIGN_HEXUTILS_HPP
