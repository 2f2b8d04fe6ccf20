/*
 * Licensed to the Apache Software Foundation (ASF) under one or more
 * contributor license agreements.  See the NOTICE file distributed with
 * this work for additional information regarding copyright ownership.
 * The ASF licenses this file to You under the Apache License, Version 2.0
 * (the "License"); you may not use this file except in compliance with
 * the License.  You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include "rss/client/ClientRetryOptions.h"
#include "rss/client/RetryUtils.h"

DECLARE_int32(rss_client_min_retry_interval_ms);

using namespace rss;
using namespace rss::client;

namespace {
using MS = std::chrono::milliseconds;

AttemptOutcome<int> failWith(const std::string& message) {
  return AttemptOutcome<int>::failure(
      std::make_exception_ptr(std::runtime_error(message)));
}
} // namespace

TEST(RetryUtilsTest, returnsFirstSuccessWithoutSleeping) {
  int calls = 0;
  auto start = std::chrono::steady_clock::now();
  auto result = RetryUtils::retryUntilNotNull<int>(
      MS(1000), MS(10000), MS(5000), [&]() {
        calls++;
        return AttemptOutcome<int>::success(std::make_unique<int>(42));
      });
  ASSERT_NE(result.value, nullptr);
  EXPECT_EQ(*result.value, 42);
  EXPECT_EQ(result.attempts, 1);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(result.lastFailure, nullptr);
  EXPECT_LT(std::chrono::steady_clock::now() - start, MS(1000));
}

TEST(RetryUtilsTest, keepsOnlyTheLastFailure) {
  int calls = 0;
  auto result = RetryUtils::retryUntilNotNull<int>(
      MS(1), MS(10), MS(10000), [&]() -> AttemptOutcome<int> {
        switch (++calls) {
          case 1:
          case 2:
          case 4:
            return failWith("failure " + std::to_string(calls));
          case 6:
            return AttemptOutcome<int>::success(std::make_unique<int>(calls));
          default:
            return AttemptOutcome<int>::none();
        }
      });
  ASSERT_NE(result.value, nullptr);
  EXPECT_EQ(*result.value, 6);
  EXPECT_EQ(result.attempts, 6);
  EXPECT_EQ(utils::exceptionPtrStr(result.lastFailure), "failure 4");
}

TEST(RetryUtilsTest, noneAttemptDoesNotClearRecordedFailure) {
  RetryResult<int> result;
  result.record(failWith("first"));
  result.record(failWith("second"));
  result.record(AttemptOutcome<int>::none());
  EXPECT_EQ(result.attempts, 3);
  EXPECT_EQ(result.value, nullptr);
  ASSERT_NE(result.lastFailure, nullptr);
  EXPECT_EQ(utils::exceptionPtrStr(result.lastFailure), "second");

  result.record(AttemptOutcome<int>::success(std::make_unique<int>(7)));
  ASSERT_NE(result.value, nullptr);
  EXPECT_EQ(*result.value, 7);
}

TEST(RetryUtilsTest, makesOneAttemptWithZeroMaxWait) {
  int calls = 0;
  auto result = RetryUtils::retryUntilNotNull<int>(
      MS(100), MS(1000), MS(0), [&]() {
        calls++;
        return failWith("down");
      });
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(result.attempts, 1);
  EXPECT_EQ(result.value, nullptr);
  EXPECT_EQ(utils::exceptionPtrStr(result.lastFailure), "down");
}

TEST(RetryUtilsTest, stopsAtDeadlineEvenWhenIntervalIsLonger) {
  int calls = 0;
  auto start = std::chrono::steady_clock::now();
  auto result = RetryUtils::retryUntilNotNull<int>(
      MS(10000), MS(100000), MS(50), [&]() {
        calls++;
        return AttemptOutcome<int>::none();
      });
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(result.value, nullptr);
  EXPECT_EQ(result.lastFailure, nullptr);
  EXPECT_EQ(calls, 2);
  EXPECT_GE(elapsed, MS(50));
  EXPECT_LT(elapsed, MS(2000));
}

TEST(RetryUtilsTest, succeedsAfterTransientFailures) {
  int calls = 0;
  auto result = RetryUtils::retryUntilNotNull<int>(
      MS(1), MS(10), MS(10000), [&]() -> AttemptOutcome<int> {
        if (++calls < 4) {
          return failWith("failure " + std::to_string(calls));
        }
        return AttemptOutcome<int>::success(std::make_unique<int>(calls));
      });
  ASSERT_NE(result.value, nullptr);
  EXPECT_EQ(*result.value, 4);
  EXPECT_EQ(result.attempts, 4);
  EXPECT_EQ(utils::exceptionPtrStr(result.lastFailure), "failure 3");
}

TEST(RetryUtilsTest, intervalDoublesUpToCap) {
  EXPECT_EQ(RetryUtils::nextRetryInterval(MS(100), MS(1000)), MS(200));
  EXPECT_EQ(RetryUtils::nextRetryInterval(MS(400), MS(1000)), MS(800));
  EXPECT_EQ(RetryUtils::nextRetryInterval(MS(800), MS(1000)), MS(1000));
  EXPECT_EQ(RetryUtils::nextRetryInterval(MS(1000), MS(1000)), MS(1000));
  // A cap below the current interval never shrinks it.
  EXPECT_EQ(RetryUtils::nextRetryInterval(MS(500), MS(100)), MS(500));
}

TEST(RetryUtilsTest, initialIntervalHasFloor) {
  EXPECT_EQ(RetryUtils::initialRetryInterval(MS(30)), MS(30));
  EXPECT_EQ(RetryUtils::initialRetryInterval(MS(0)), MS(1));
  EXPECT_EQ(RetryUtils::initialRetryInterval(MS(-5)), MS(1));

  auto saved = FLAGS_rss_client_min_retry_interval_ms;
  FLAGS_rss_client_min_retry_interval_ms = 50;
  EXPECT_EQ(RetryUtils::initialRetryInterval(MS(30)), MS(50));
  FLAGS_rss_client_min_retry_interval_ms = saved;
}

TEST(RetryUtilsTest, successRequiresValueAndFailureRequiresCause) {
  EXPECT_THROW(
      AttemptOutcome<int>::success(nullptr), utils::RssRuntimeError);
  EXPECT_THROW(AttemptOutcome<int>::failure(nullptr), utils::RssRuntimeError);
}

TEST(ClientRetryOptionsTest, capIsTenTimesInterval) {
  ClientRetryOptions options(MS(250), MS(60000));
  EXPECT_EQ(options.retryInterval(), MS(250));
  EXPECT_EQ(options.retryIntervalCap(), MS(2500));
  EXPECT_EQ(options.retryMaxWait(), MS(60000));

  protocol::ServerDetail server("s1", "host-1:19000");
  EXPECT_EQ(options.serverDetailResolver()(server), server);
}

TEST(ClientRetryOptionsTest, fromConfReadsRetrySettings) {
  conf::RssConf conf;
  conf.setValue(std::string(conf::RssConf::kReadRetryInterval), "500ms");
  conf.setValue(std::string(conf::RssConf::kReadRetryMaxWait), "2m");
  auto options = ClientRetryOptions::fromConf(conf);
  EXPECT_EQ(options.retryInterval(), MS(500));
  EXPECT_EQ(options.retryIntervalCap(), MS(5000));
  EXPECT_EQ(options.retryMaxWait(), MS(120000));
}
