/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KMS_RETRY_POLICY_HPP
#define KMSIGN_KMS_RETRY_POLICY_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace kmsign::kms {

  /// Produces jitter values in [0, 1]
  using JitterSource = std::function<double()>;

  /**
   * Bounds of the retry of transient service failures. The policy is a
   * value; the delay only depends on its arguments.
   */
  struct RetryPolicy {
    /// total number of calls, the first one included
    std::size_t max_attempts{5};
    std::chrono::milliseconds base_delay{100};
    std::chrono::milliseconds max_delay{2000};
    /// no retry is started if it would end after this much time
    std::chrono::milliseconds max_elapsed{20000};
    double backoff_factor{2.0};

    /**
     * Delay before the next attempt.
     * @param failed_attempts - number of attempts made so far, at least 1
     * @param jitter - value in [0, 1]; 0 gives half of the exponential delay,
     * 1 gives all of it
     * @return min(max_delay, base_delay * factor^(failed_attempts - 1)),
     * scaled to [d/2, d] by @a jitter
     */
    std::chrono::milliseconds backoffDelay(std::size_t failed_attempts,
                                           double jitter) const;

    std::string toString() const;
  };

  /// Uniform jitter from a thread-local generator
  JitterSource makeDefaultJitterSource();

  /// Always returns @a value; for deterministic delays
  JitterSource makeFixedJitterSource(double value);

}  // namespace kmsign::kms

#endif  // KMSIGN_KMS_RETRY_POLICY_HPP
