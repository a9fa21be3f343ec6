/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "kms/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>

#include <fmt/core.h>

using namespace kmsign::kms;

std::chrono::milliseconds RetryPolicy::backoffDelay(
    std::size_t failed_attempts, double jitter) const {
  auto const exponent =
      static_cast<double>(std::max<std::size_t>(failed_attempts, 1) - 1);
  auto const exponential = static_cast<double>(base_delay.count())
      * std::pow(backoff_factor, exponent);
  auto const capped =
      std::min(exponential, static_cast<double>(max_delay.count()));
  auto const clamped_jitter = std::clamp(jitter, 0.0, 1.0);
  auto const jittered = capped / 2.0 + clamped_jitter * capped / 2.0;
  return std::chrono::milliseconds(
      static_cast<int64_t>(std::llround(jittered)));
}

std::string RetryPolicy::toString() const {
  return fmt::format(
      "RetryPolicy{{max_attempts: {}, base_delay: {} ms, max_delay: {} ms, "
      "max_elapsed: {} ms, backoff_factor: {}}}",
      max_attempts,
      base_delay.count(),
      max_delay.count(),
      max_elapsed.count(),
      backoff_factor);
}

JitterSource kmsign::kms::makeDefaultJitterSource() {
  return [] {
    thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_real_distribution<double> distribution(0.0, 1.0);
    return distribution(generator);
  };
}

JitterSource kmsign::kms::makeFixedJitterSource(double value) {
  return [value] { return value; };
}
