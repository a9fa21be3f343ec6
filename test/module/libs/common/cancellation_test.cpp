/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/cancellation.hpp"

#include <thread>

#include <gtest/gtest.h>

using namespace kmsign;
using namespace std::chrono_literals;

/**
 * @given a fresh token without deadline
 * @when nothing happens
 * @then it is not cancelled and has no remaining time
 */
TEST(CancellationTokenTest, FreshToken) {
  CancellationToken token;
  EXPECT_FALSE(token.isCancelled());
  EXPECT_FALSE(token.remaining());
}

/**
 * @given a token
 * @when it is cancelled
 * @then it reports cancellation and waits return immediately with false
 */
TEST(CancellationTokenTest, CancelStopsWaiting) {
  CancellationToken token;
  token.cancel();
  EXPECT_TRUE(token.isCancelled());

  auto const started = std::chrono::steady_clock::now();
  EXPECT_FALSE(token.waitFor(10s));
  EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
}

/**
 * @given a token waited on for a long time
 * @when another thread cancels it
 * @then the wait ends early with false
 */
TEST(CancellationTokenTest, CancelFromAnotherThread) {
  CancellationToken token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(50ms);
    token.cancel();
  });

  auto const started = std::chrono::steady_clock::now();
  EXPECT_FALSE(token.waitFor(10s));
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
  canceller.join();
}

/**
 * @given a token that is never cancelled
 * @when it is waited on for a short duration
 * @then the whole duration elapses and the wait returns true
 */
TEST(CancellationTokenTest, WaitElapses) {
  CancellationToken token;
  auto const started = std::chrono::steady_clock::now();
  EXPECT_TRUE(token.waitFor(20ms));
  EXPECT_GE(std::chrono::steady_clock::now() - started, 20ms);
}

/**
 * @given a token with a deadline shorter than a wait
 * @when it is waited on
 * @then the wait stops at the deadline with false and the token is cancelled
 */
TEST(CancellationTokenTest, DeadlineCutsWait) {
  auto token = CancellationToken::withTimeout(30ms);
  ASSERT_TRUE(token->remaining());
  EXPECT_LE(*token->remaining(), 30ms);

  EXPECT_FALSE(token->waitFor(10s));
  EXPECT_TRUE(token->isCancelled());
  EXPECT_EQ(*token->remaining(), 0ms);
}
