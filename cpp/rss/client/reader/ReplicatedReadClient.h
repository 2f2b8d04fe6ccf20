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

#include <optional>

#include "rss/client/ClientRetryOptions.h"
#include "rss/client/ReadClientDataOptions.h"
#include "rss/client/reader/KeyValueRecord.h"
#include "rss/protocol/AppShufflePartitionId.h"
#include "rss/protocol/ServerReplicationGroup.h"

namespace rss {
namespace client {
/// Everything a replica-set read client needs besides its server group.
struct ReadClientOptions {
  utils::Timeout timeout;
  ClientRetryOptions retryOptions;
  bool compressed;
  int readQueueSize;
  std::string user;
  protocol::AppShufflePartitionId appShufflePartitionId;
  ReadClientDataOptions dataOptions;
  bool checkShuffleReplicaConsistency;
};

/// Reads one shard of a shuffle partition from a group of replicated servers.
/// Implementations check that the replicas agree and decode the record
/// stream; every method may block and may throw.
class ReplicatedReadClient {
 public:
  virtual ~ReplicatedReadClient() = default;

  virtual void connect() = 0;

  /// Returns std::nullopt once the group has no more records. Stays
  /// exhausted after that.
  virtual std::optional<KeyValueRecord> readRecord() = 0;

  /// Must be safe to call more than once, and on a client whose connect()
  /// failed.
  virtual void close() = 0;

  virtual int64_t getShuffleReadBytes() const = 0;

  virtual std::string toString() const = 0;
};

class ReplicatedReadClientFactory {
 public:
  virtual ~ReplicatedReadClientFactory() = default;

  /// Creates an unconnected client for the group. May return nullptr when no
  /// client can be created at the moment.
  virtual std::unique_ptr<ReplicatedReadClient> createClient(
      const protocol::ServerReplicationGroup& group,
      const ReadClientOptions& options) = 0;
};
} // namespace client
} // namespace rss
