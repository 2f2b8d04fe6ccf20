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

#include <mutex>
#include <optional>
#include <vector>

#include "rss/client/RetryUtils.h"
#include "rss/client/reader/ReplicatedReadClient.h"

namespace rss {
namespace client {
/// Reads one shuffle partition whose data is spread over several server
/// groups, as a single stream of records.
class MultiServerReadClient {
 public:
  virtual ~MultiServerReadClient() = default;

  virtual void connect() = 0;

  /// Returns std::nullopt once every server group is exhausted.
  virtual std::optional<KeyValueRecord> readRecord() = 0;

  virtual void close() = 0;

  virtual int64_t getShuffleReadBytes() const = 0;
};

/// Visits the server groups strictly in the given order, one open group at a
/// time. Connecting to a group is retried with backoff until the retry max
/// wait elapses; each group gets its own retry budget. All public methods
/// are serialized on one mutex.
class MultiServerSocketReadClient : public MultiServerReadClient {
 public:
  enum class State {
    // connect() has not been called yet.
    kNotConnected,
    // A group client is open.
    kActive,
    // connect() or the advance to a later group failed.
    kFailed,
    // Every group was read to the end and closed.
    kAllExhausted,
    kClosed,
  };

  /// Derives the retry options from the data poll interval and the timeout.
  MultiServerSocketReadClient(
      std::vector<protocol::ServerReplicationGroup> servers,
      utils::Timeout timeout,
      bool compressed,
      int readQueueSize,
      const std::string& user,
      const protocol::AppShufflePartitionId& appShufflePartitionId,
      const ReadClientDataOptions& dataOptions,
      bool checkShuffleReplicaConsistency,
      std::shared_ptr<ReplicatedReadClientFactory> clientFactory);

  MultiServerSocketReadClient(
      std::vector<protocol::ServerReplicationGroup> servers,
      utils::Timeout timeout,
      const ClientRetryOptions& retryOptions,
      bool compressed,
      int readQueueSize,
      const std::string& user,
      const protocol::AppShufflePartitionId& appShufflePartitionId,
      const ReadClientDataOptions& dataOptions,
      bool checkShuffleReplicaConsistency,
      std::shared_ptr<ReplicatedReadClientFactory> clientFactory);

  ~MultiServerSocketReadClient() override;

  MultiServerSocketReadClient(const MultiServerSocketReadClient&) = delete;

  MultiServerSocketReadClient& operator=(const MultiServerSocketReadClient&) =
      delete;

  void connect() override;

  std::optional<KeyValueRecord> readRecord() override;

  void close() override;

  int64_t getShuffleReadBytes() const override;

  State state() const;

  size_t nextGroupIndex() const;

  size_t groupCount() const {
    return servers_.size();
  }

  std::string toString() const;

 private:
  // Connects to servers_[nextClientIndex_] with retry. Requires mutex_.
  void connectAndInitializeClient();

  AttemptOutcome<ReplicatedReadClient> tryCreateAndConnect(
      const protocol::ServerReplicationGroup& group,
      const std::string& failMsg,
      int attempt);

  // Closes and releases the client, logging instead of throwing on failure.
  void closeClient(std::unique_ptr<ReplicatedReadClient>& client) const;

  void closeLocked();

  std::string toStringLocked() const;

  const std::vector<protocol::ServerReplicationGroup> servers_;
  const ReadClientOptions options_;
  const std::shared_ptr<ReplicatedReadClientFactory> clientFactory_;

  mutable std::mutex mutex_;
  State state_{State::kNotConnected};
  size_t nextClientIndex_{0};
  int64_t shuffleReadBytesOfFinishedClients_{0};
  std::unique_ptr<ReplicatedReadClient> currentClient_;
};

std::string toString(MultiServerSocketReadClient::State state);
} // namespace client
} // namespace rss
