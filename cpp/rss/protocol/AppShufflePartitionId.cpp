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

#include "rss/protocol/AppShufflePartitionId.h"

#include <fmt/format.h>

#include "rss/utils/RssUtils.h"

namespace rss {
namespace protocol {
AppShufflePartitionId::AppShufflePartitionId(
    std::string appId,
    std::string appAttempt,
    int shuffleId,
    int partitionId)
    : appId(std::move(appId)),
      appAttempt(std::move(appAttempt)),
      shuffleId(shuffleId),
      partitionId(partitionId) {}

std::string AppShufflePartitionId::shuffleKey() const {
  return utils::makeShuffleKey(appId, shuffleId);
}

std::string AppShufflePartitionId::toString() const {
  return fmt::format(
      "AppShufflePartitionId{{appId={}, appAttempt={}, shuffleId={}, partitionId={}}}",
      appId,
      appAttempt,
      shuffleId,
      partitionId);
}

std::ostream& operator<<(std::ostream& os, const AppShufflePartitionId& id) {
  return os << id.toString();
}
} // namespace protocol
} // namespace rss
