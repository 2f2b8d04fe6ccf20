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

#include "rss/client/ReadClientDataOptions.h"

#include <fmt/chrono.h>
#include <fmt/ranges.h>

namespace rss {
namespace client {
ReadClientDataOptions::ReadClientDataOptions(
    std::set<int64_t> latestTaskAttemptIds,
    utils::Timeout dataAvailablePollInterval,
    utils::Timeout dataAvailableWaitTime)
    : latestTaskAttemptIds(std::move(latestTaskAttemptIds)),
      dataAvailablePollInterval(dataAvailablePollInterval),
      dataAvailableWaitTime(dataAvailableWaitTime) {}

ReadClientDataOptions ReadClientDataOptions::fromConf(
    const conf::RssConf& conf,
    std::set<int64_t> latestTaskAttemptIds) {
  return ReadClientDataOptions(
      std::move(latestTaskAttemptIds),
      conf.readDataAvailablePollInterval(),
      conf.readDataAvailableWaitTime());
}

std::string ReadClientDataOptions::toString() const {
  return fmt::format(
      "ReadClientDataOptions{{latestTaskAttemptIds={}, dataAvailablePollInterval={}, dataAvailableWaitTime={}}}",
      latestTaskAttemptIds,
      dataAvailablePollInterval,
      dataAvailableWaitTime);
}
} // namespace client
} // namespace rss
