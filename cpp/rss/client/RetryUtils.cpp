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

#include "rss/client/RetryUtils.h"

#include <algorithm>

#include <gflags/gflags.h>

DECLARE_int32(rss_client_min_retry_interval_ms);

namespace rss {
namespace client {
utils::Timeout RetryUtils::initialRetryInterval(utils::Timeout interval) {
  return std::max(
      interval, utils::Timeout(FLAGS_rss_client_min_retry_interval_ms));
}

utils::Timeout RetryUtils::nextRetryInterval(
    utils::Timeout current,
    utils::Timeout cap) {
  if (current >= cap) {
    return current;
  }
  return std::min(current * 2, cap);
}
} // namespace client
} // namespace rss
