/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_CANCELLATION_HPP
#define KMSIGN_CANCELLATION_HPP

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace kmsign {

  /**
   * Caller-owned cancellation signal with an optional deadline. Passed by
   * reference to every blocking operation; an operation observing
   * isCancelled() must stop without starting any further remote call.
   */
  class CancellationToken {
   public:
    using Clock = std::chrono::steady_clock;

    /// token that is only cancelled by an explicit cancel() call
    CancellationToken();

    /// token that is also cancelled once @a deadline is reached
    explicit CancellationToken(Clock::time_point deadline);

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    /// Make a token that expires after @a timeout from now
    static std::unique_ptr<CancellationToken> withTimeout(
        std::chrono::milliseconds timeout);

    /// Cancel and wake up every waiting thread
    void cancel();

    bool isCancelled() const;

    /// @return time left until the deadline, if there is one
    std::optional<std::chrono::milliseconds> remaining() const;

    /**
     * Block for @a duration or until cancelled, whichever comes first
     * @return true if the whole duration elapsed, false if the token was
     * cancelled or its deadline passed during the wait
     */
    bool waitFor(std::chrono::milliseconds duration) const;

   private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_;
    std::optional<Clock::time_point> deadline_;
  };

}  // namespace kmsign

#endif  // KMSIGN_CANCELLATION_HPP
