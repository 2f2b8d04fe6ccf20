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

#include <set>
#include <string>

#include "rss/conf/RssConf.h"
#include "rss/utils/RssUtils.h"

namespace rss {
namespace client {
/// Options on which data to read and how long to wait for it to become
/// available on the servers. Consumed by the replica-set read client.
struct ReadClientDataOptions {
  // Only records written by these task attempts are returned.
  std::set<int64_t> latestTaskAttemptIds;
  utils::Timeout dataAvailablePollInterval;
  utils::Timeout dataAvailableWaitTime;

  ReadClientDataOptions(
      std::set<int64_t> latestTaskAttemptIds,
      utils::Timeout dataAvailablePollInterval,
      utils::Timeout dataAvailableWaitTime);

  static ReadClientDataOptions fromConf(
      const conf::RssConf& conf,
      std::set<int64_t> latestTaskAttemptIds);

  std::string toString() const;
};
} // namespace client
} // namespace rss
