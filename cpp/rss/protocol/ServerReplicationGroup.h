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
#include <vector>

namespace rss {
namespace protocol {
struct ServerDetail {
  std::string serverId;
  // "host:port"
  std::string connectionString;

  ServerDetail() = default;

  ServerDetail(std::string serverId, std::string connectionString);

  std::string host() const;

  int port() const;

  std::string toString() const;

  bool operator==(const ServerDetail& rhs) const {
    return serverId == rhs.serverId && connectionString == rhs.connectionString;
  }

  bool operator!=(const ServerDetail& rhs) const {
    return !(*this == rhs);
  }
};

/// A set of servers which each hold a replica of the same shard of a shuffle
/// partition. The order of the servers is kept as given.
struct ServerReplicationGroup {
  std::vector<ServerDetail> servers;

  ServerReplicationGroup() = default;

  explicit ServerReplicationGroup(std::vector<ServerDetail> servers);

  std::string toString() const;

  bool operator==(const ServerReplicationGroup& rhs) const {
    return servers == rhs.servers;
  }

  bool operator!=(const ServerReplicationGroup& rhs) const {
    return !(*this == rhs);
  }
};

std::ostream& operator<<(std::ostream& os, const ServerDetail& server);

std::ostream& operator<<(std::ostream& os, const ServerReplicationGroup& group);

std::string toString(const std::vector<ServerReplicationGroup>& groups);
} // namespace protocol
} // namespace rss
