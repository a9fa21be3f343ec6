/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KMSIGN_KMS_RETRY_HPP
#define KMSIGN_KMS_RETRY_HPP

#include <chrono>
#include <ciso646>
#include <string>
#include <type_traits>
#include <utility>

#include "common/cancellation.hpp"
#include "common/result.hpp"
#include "key/kms_error.hpp"
#include "kms/key_management_client.hpp"
#include "kms/retry_policy.hpp"
#include "logger/logger.hpp"

namespace kmsign::kms {

  /**
   * Invokes callable until it succeeds, fails permanently, the retry budget
   * of @a policy is used up or @a cancel fires. Shared by every call site of
   * the key-management service.
   * @tparam Callable returning Result<T, ServiceError>
   * @param policy - attempt and time budget
   * @param jitter - source of the backoff jitter
   * @param cancel - checked before each attempt and interrupts the backoff
   * @param log - receives a warning per retried failure
   * @param operation - human readable name of the call, e.g. "GetPublicKey of
   * 'key-1'"
   * @param callable - the service call
   * @return the first successful value, or the KmsError describing why there
   * is none
   */
  template <typename Callable>
  auto callWithRetry(RetryPolicy const &policy,
                     JitterSource const &jitter,
                     CancellationToken const &cancel,
                     logger::LoggerPtr const &log,
                     std::string const &operation,
                     Callable &&callable)
      -> expected::Result<
          expected::InnerValueOf<std::invoke_result_t<Callable &>>,
          KmsError> {
    using CallResult = std::decay_t<std::invoke_result_t<Callable &>>;
    using ReturnType =
        expected::Result<expected::InnerValueOf<CallResult>, KmsError>;
    using Clock = std::chrono::steady_clock;

    static_assert(
        std::is_same_v<expected::InnerErrorOf<CallResult>, ServiceError>,
        "callable must report ServiceError");

    auto const started = Clock::now();
    for (std::size_t attempt = 1;; ++attempt) {
      if (cancel.isCancelled()) {
        return expected::makeError(KmsError::cancelled(
            fmt::format("{} cancelled before attempt {}", operation, attempt)));
      }

      CallResult result = callable();
      if (auto *value = boost::get<expected::ValueOf<CallResult>>(&result)) {
        if (attempt > 1) {
          log->info("{} succeeded on attempt {}", operation, attempt);
        }
        return ReturnType(expected::makeValue(std::move(value->value)));
      }
      ServiceError error = std::move(result).assumeError();

      if (cancel.isCancelled()) {
        return expected::makeError(KmsError::cancelled(fmt::format(
            "{} cancelled during attempt {}: {}", operation, attempt, error)));
      }

      if (not error.isTransient()) {
        log->error("{} failed: {}", operation, error);
        return expected::makeError(KmsError::remoteService(
            fmt::format("{} failed: {}", operation, error.message),
            false,
            false));
      }

      if (attempt >= policy.max_attempts) {
        log->error("{} failed {} times, giving up: {}",
                   operation,
                   attempt,
                   error);
        return expected::makeError(KmsError::remoteService(
            fmt::format("{} failed after {} attempts: {}",
                        operation,
                        attempt,
                        error.message),
            true,
            true));
      }

      auto const delay = policy.backoffDelay(attempt, jitter());
      auto const elapsed =
          std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now()
                                                                - started);
      if (elapsed + delay > policy.max_elapsed) {
        log->error("{} failed, no time left for a retry after {} ms: {}",
                   operation,
                   elapsed.count(),
                   error);
        return expected::makeError(KmsError::remoteService(
            fmt::format("{} failed after {} attempts in {} ms: {}",
                        operation,
                        attempt,
                        elapsed.count(),
                        error.message),
            true,
            true));
      }

      log->warn("{} failed on attempt {} of {}, retrying in {} ms: {}",
                operation,
                attempt,
                policy.max_attempts,
                delay.count(),
                error);
      if (not cancel.waitFor(delay)) {
        return expected::makeError(KmsError::cancelled(fmt::format(
            "{} cancelled while waiting to retry after attempt {}",
            operation,
            attempt)));
      }
    }
  }

}  // namespace kmsign::kms

#endif  // KMSIGN_KMS_RETRY_HPP
