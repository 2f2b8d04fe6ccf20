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

#include "rss/protocol/ServerReplicationGroup.h"

#include <folly/String.h>

#include "rss/utils/RssUtils.h"

namespace rss {
namespace protocol {
ServerDetail::ServerDetail(std::string serverId, std::string connectionString)
    : serverId(std::move(serverId)),
      connectionString(std::move(connectionString)) {}

std::string ServerDetail::host() const {
  auto parsed = utils::parseColonSeparatedHostPorts(connectionString, 1);
  return std::string(parsed[0]);
}

int ServerDetail::port() const {
  auto parsed = utils::parseColonSeparatedHostPorts(connectionString, 1);
  return utils::strv2val<int>(parsed[1]);
}

std::string ServerDetail::toString() const {
  return "Server{" + serverId + ", " + connectionString + "}";
}

ServerReplicationGroup::ServerReplicationGroup(std::vector<ServerDetail> servers)
    : servers(std::move(servers)) {}

std::string ServerReplicationGroup::toString() const {
  std::vector<std::string> parts;
  parts.reserve(servers.size());
  for (const auto& server : servers) {
    parts.emplace_back(server.toString());
  }
  return "ServerReplicationGroup{servers=[" + folly::join(", ", parts) + "]}";
}

std::ostream& operator<<(std::ostream& os, const ServerDetail& server) {
  return os << server.toString();
}

std::ostream& operator<<(std::ostream& os, const ServerReplicationGroup& group) {
  return os << group.toString();
}

std::string toString(const std::vector<ServerReplicationGroup>& groups) {
  std::vector<std::string> parts;
  parts.reserve(groups.size());
  for (const auto& group : groups) {
    parts.emplace_back(group.toString());
  }
  return "[" + folly::join(", ", parts) + "]";
}
} // namespace protocol
} // namespace rss
