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

#include <ostream>
#include <string>

namespace rss {
namespace protocol {
/// Identifies the shuffle partition a read client works on.
struct AppShufflePartitionId {
  std::string appId;
  std::string appAttempt;
  int shuffleId{0};
  int partitionId{0};

  AppShufflePartitionId() = default;

  AppShufflePartitionId(
      std::string appId,
      std::string appAttempt,
      int shuffleId,
      int partitionId);

  std::string shuffleKey() const;

  std::string toString() const;

  bool operator==(const AppShufflePartitionId& rhs) const {
    return appId == rhs.appId && appAttempt == rhs.appAttempt &&
        shuffleId == rhs.shuffleId && partitionId == rhs.partitionId;
  }
};

std::ostream& operator<<(std::ostream& os, const AppShufflePartitionId& id);
} // namespace protocol
} // namespace rss
