/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/cancellation.hpp"

#include <algorithm>
#include <ciso646>

using namespace kmsign;

CancellationToken::CancellationToken() : cancelled_(false) {}

CancellationToken::CancellationToken(Clock::time_point deadline)
    : cancelled_(false), deadline_(deadline) {}

std::unique_ptr<CancellationToken> CancellationToken::withTimeout(
    std::chrono::milliseconds timeout) {
  return std::make_unique<CancellationToken>(Clock::now() + timeout);
}

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::isCancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_ or (deadline_ and Clock::now() >= *deadline_);
}

std::optional<std::chrono::milliseconds> CancellationToken::remaining() const {
  if (not deadline_) {
    return std::nullopt;
  }
  auto const left = std::chrono::duration_cast<std::chrono::milliseconds>(
      *deadline_ - Clock::now());
  return std::max(left, std::chrono::milliseconds::zero());
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
  auto wake_at = Clock::now() + duration;
  bool const stops_at_deadline = deadline_ and *deadline_ <= wake_at;
  if (stops_at_deadline) {
    wake_at = *deadline_;
  }

  std::unique_lock<std::mutex> lock(mutex_);
  if (cv_.wait_until(lock, wake_at, [this] { return cancelled_; })) {
    return false;
  }
  return not stops_at_deadline;
}
