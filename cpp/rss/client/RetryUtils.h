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

#pragma once

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <thread>

#include "rss/utils/RssUtils.h"

namespace rss {
namespace client {
/// Result of a single attempt inside a retry loop: either a value, a failure
/// with its cause, or nothing at all.
template <typename T>
class AttemptOutcome {
 public:
  enum class Kind { kSuccess, kFailure, kNone };

  static AttemptOutcome success(std::unique_ptr<T> value) {
    RSS_CHECK_NOT_NULL(value, "a successful attempt must carry a value");
    return AttemptOutcome(Kind::kSuccess, std::move(value), nullptr);
  }

  static AttemptOutcome failure(std::exception_ptr cause) {
    RSS_CHECK(cause != nullptr, "a failed attempt must carry its cause");
    return AttemptOutcome(Kind::kFailure, nullptr, std::move(cause));
  }

  static AttemptOutcome none() {
    return AttemptOutcome(Kind::kNone, nullptr, nullptr);
  }

  Kind kind() const {
    return kind_;
  }

  std::unique_ptr<T> takeValue() {
    return std::move(value_);
  }

  const std::exception_ptr& cause() const {
    return cause_;
  }

 private:
  AttemptOutcome(
      Kind kind,
      std::unique_ptr<T> value,
      std::exception_ptr cause)
      : kind_(kind), value_(std::move(value)), cause_(std::move(cause)) {}

  Kind kind_;
  std::unique_ptr<T> value_;
  std::exception_ptr cause_;
};

template <typename T>
struct RetryResult {
  // nullptr when no attempt succeeded.
  std::unique_ptr<T> value;
  // Only the most recent failure is kept.
  std::exception_ptr lastFailure;
  int attempts{0};

  void record(AttemptOutcome<T>&& outcome) {
    attempts++;
    switch (outcome.kind()) {
      case AttemptOutcome<T>::Kind::kSuccess:
        value = outcome.takeValue();
        break;
      case AttemptOutcome<T>::Kind::kFailure:
        lastFailure = outcome.cause();
        break;
      case AttemptOutcome<T>::Kind::kNone:
        break;
    }
  }
};

class RetryUtils {
 public:
  /// The first sleep between two attempts, never below the
  /// rss_client_min_retry_interval_ms flag.
  static utils::Timeout initialRetryInterval(utils::Timeout interval);

  /// Doubles the current interval without exceeding the cap. A cap below the
  /// current interval keeps the current interval.
  static utils::Timeout nextRetryInterval(
      utils::Timeout current,
      utils::Timeout cap);

  /// Calls attempt until it succeeds or maxWait has elapsed since the first
  /// call. At least one attempt is always made, and no sleep extends past
  /// the deadline.
  template <typename T>
  static RetryResult<T> retryUntilNotNull(
      utils::Timeout interval,
      utils::Timeout intervalCap,
      utils::Timeout maxWait,
      const std::function<AttemptOutcome<T>()>& attempt) {
    const auto start = std::chrono::steady_clock::now();
    auto retryInterval = initialRetryInterval(interval);
    RetryResult<T> result;
    while (true) {
      result.record(attempt());
      if (result.value) {
        return result;
      }
      auto elapsed = std::chrono::duration_cast<utils::Timeout>(
          std::chrono::steady_clock::now() - start);
      if (elapsed >= maxWait) {
        return result;
      }
      std::this_thread::sleep_for(std::min(retryInterval, maxWait - elapsed));
      retryInterval = nextRetryInterval(retryInterval, intervalCap);
    }
  }
};
} // namespace client
} // namespace rss
