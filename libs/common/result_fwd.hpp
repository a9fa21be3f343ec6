/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_RESULT_FWD_HPP
#define KMSIGN_RESULT_FWD_HPP

namespace kmsign {
  namespace expected {

    template <typename T>
    struct Value;

    template <typename E>
    struct Error;

    class ResultException;

    template <typename V, typename E>
    class Result;

  }  // namespace expected
}  // namespace kmsign

#endif  // KMSIGN_RESULT_FWD_HPP
