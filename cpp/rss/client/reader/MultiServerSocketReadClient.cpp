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

#include "rss/client/reader/MultiServerSocketReadClient.h"

#include <exception>

#include <fmt/format.h>
#include <folly/ExceptionString.h>
#include <folly/ScopeGuard.h>
#include <glog/logging.h>

namespace rss {
namespace client {
MultiServerSocketReadClient::MultiServerSocketReadClient(
    std::vector<protocol::ServerReplicationGroup> servers,
    utils::Timeout timeout,
    bool compressed,
    int readQueueSize,
    const std::string& user,
    const protocol::AppShufflePartitionId& appShufflePartitionId,
    const ReadClientDataOptions& dataOptions,
    bool checkShuffleReplicaConsistency,
    std::shared_ptr<ReplicatedReadClientFactory> clientFactory)
    : MultiServerSocketReadClient(
          std::move(servers),
          timeout,
          ClientRetryOptions(dataOptions.dataAvailablePollInterval, timeout),
          compressed,
          readQueueSize,
          user,
          appShufflePartitionId,
          dataOptions,
          checkShuffleReplicaConsistency,
          std::move(clientFactory)) {}

MultiServerSocketReadClient::MultiServerSocketReadClient(
    std::vector<protocol::ServerReplicationGroup> servers,
    utils::Timeout timeout,
    const ClientRetryOptions& retryOptions,
    bool compressed,
    int readQueueSize,
    const std::string& user,
    const protocol::AppShufflePartitionId& appShufflePartitionId,
    const ReadClientDataOptions& dataOptions,
    bool checkShuffleReplicaConsistency,
    std::shared_ptr<ReplicatedReadClientFactory> clientFactory)
    : servers_(std::move(servers)),
      options_{
          timeout,
          retryOptions,
          compressed,
          readQueueSize,
          user,
          appShufflePartitionId,
          dataOptions,
          checkShuffleReplicaConsistency},
      clientFactory_(std::move(clientFactory)) {
  RSS_USER_CHECK(
      !servers_.empty(),
      "No server provided, partition: {}",
      appShufflePartitionId.toString());
  RSS_USER_CHECK(
      clientFactory_ != nullptr,
      "No replicated read client factory provided, partition: {}",
      appShufflePartitionId.toString());
}

MultiServerSocketReadClient::~MultiServerSocketReadClient() {
  close();
}

void MultiServerSocketReadClient::connect() {
  std::lock_guard<std::mutex> lock(mutex_);
  RSS_CHECK(
      state_ == State::kNotConnected,
      "connect() called in state {}: {}",
      client::toString(state_),
      toStringLocked());

  auto failureGuard = folly::makeGuard([this] { state_ = State::kFailed; });
  connectAndInitializeClient();
  failureGuard.dismiss();
  state_ = State::kActive;
}

std::optional<KeyValueRecord> MultiServerSocketReadClient::readRecord() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == State::kAllExhausted) {
    return std::nullopt;
  }
  RSS_CHECK(
      state_ == State::kActive,
      "readRecord() called in state {}, connect() must succeed first: {}",
      client::toString(state_),
      toStringLocked());
  RSS_CHECK_NOT_NULL(currentClient_);

  auto record = currentClient_->readRecord();
  while (!record.has_value()) {
    auto finishedBytes = currentClient_->getShuffleReadBytes();
    shuffleReadBytesOfFinishedClients_ += finishedBytes;
    VLOG(1) << "Finished reading " << finishedBytes << " bytes from server "
            << servers_[nextClientIndex_ - 1] << ", partition: "
            << options_.appShufflePartitionId;
    closeClient(currentClient_);

    if (nextClientIndex_ == servers_.size()) {
      state_ = State::kAllExhausted;
      return std::nullopt;
    }

    auto failureGuard = folly::makeGuard([this] { state_ = State::kFailed; });
    connectAndInitializeClient();
    failureGuard.dismiss();
    record = currentClient_->readRecord();
  }

  return record;
}

void MultiServerSocketReadClient::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closeLocked();
}

int64_t MultiServerSocketReadClient::getShuffleReadBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!currentClient_) {
    return shuffleReadBytesOfFinishedClients_;
  }
  return shuffleReadBytesOfFinishedClients_ +
      currentClient_->getShuffleReadBytes();
}

MultiServerSocketReadClient::State MultiServerSocketReadClient::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

size_t MultiServerSocketReadClient::nextGroupIndex() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return nextClientIndex_;
}

std::string MultiServerSocketReadClient::toString() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return toStringLocked();
}

void MultiServerSocketReadClient::connectAndInitializeClient() {
  RSS_CHECK_LT(
      nextClientIndex_,
      servers_.size(),
      "Invalid operation, next client index {}, total servers {}",
      nextClientIndex_,
      servers_.size());

  const auto& group = servers_[nextClientIndex_];
  const auto& partition = options_.appShufflePartitionId;
  LOG(INFO) << "Fetching data from server: " << group << " ("
            << nextClientIndex_ + 1 << " out of " << servers_.size()
            << "), partition: " << partition;

  const auto failMsg = fmt::format(
      "Failed to connect to server: {}, partition: {}",
      group.toString(),
      partition.toString());
  const auto& retryOptions = options_.retryOptions;
  int attempt = 0;
  auto result = RetryUtils::retryUntilNotNull<ReplicatedReadClient>(
      retryOptions.retryInterval(),
      retryOptions.retryIntervalCap(),
      retryOptions.retryMaxWait(),
      [&]() { return tryCreateAndConnect(group, failMsg, ++attempt); });

  if (!result.value) {
    LOG(ERROR) << failMsg << ", gave up after " << result.attempts
               << " attempt(s) within " << retryOptions.retryMaxWait().count()
               << " ms";
    if (!result.lastFailure) {
      throw utils::RssRuntimeError(
          __FILE__,
          __LINE__,
          __FUNCTION__,
          "",
          failMsg,
          utils::error_code::kConnectionFailure,
          true);
    }
    try {
      std::rethrow_exception(result.lastFailure);
    } catch (const utils::RssException&) {
      throw;
    } catch (...) {
      throw utils::RssRuntimeError(
          __FILE__,
          __LINE__,
          __FUNCTION__,
          "",
          failMsg,
          utils::error_code::kConnectionFailure,
          true,
          result.lastFailure);
    }
  }

  currentClient_ = std::move(result.value);
  nextClientIndex_++;
}

AttemptOutcome<ReplicatedReadClient>
MultiServerSocketReadClient::tryCreateAndConnect(
    const protocol::ServerReplicationGroup& group,
    const std::string& failMsg,
    int attempt) {
  std::unique_ptr<ReplicatedReadClient> client;
  std::exception_ptr failure;
  try {
    client = clientFactory_->createClient(group, options_);
    if (!client) {
      LOG(WARNING) << failMsg << ", attempt " << attempt
                   << ": no client created";
      return AttemptOutcome<ReplicatedReadClient>::none();
    }
    client->connect();
    return AttemptOutcome<ReplicatedReadClient>::success(std::move(client));
  } catch (const std::exception& e) {
    failure = std::current_exception();
    LOG(WARNING) << failMsg << ", attempt " << attempt
                 << ", error: " << folly::exceptionStr(e);
  } catch (...) {
    failure = std::current_exception();
    LOG(WARNING) << failMsg << ", attempt " << attempt
                 << ", error: " << folly::exceptionStr(failure);
  }
  closeClient(client);
  return AttemptOutcome<ReplicatedReadClient>::failure(std::move(failure));
}

void MultiServerSocketReadClient::closeClient(
    std::unique_ptr<ReplicatedReadClient>& client) const {
  if (!client) {
    return;
  }
  auto releaseGuard = folly::makeGuard([&client] { client.reset(); });
  try {
    client->close();
  } catch (const std::exception& e) {
    LOG(WARNING) << "Failed to close client " << client->toString()
                 << ", error: " << folly::exceptionStr(e);
  } catch (...) {
    LOG(WARNING) << "Failed to close client " << client->toString()
                 << ", error: "
                 << folly::exceptionStr(std::current_exception());
  }
}

void MultiServerSocketReadClient::closeLocked() {
  if (currentClient_) {
    shuffleReadBytesOfFinishedClients_ += currentClient_->getShuffleReadBytes();
    closeClient(currentClient_);
  }
  state_ = State::kClosed;
}

std::string MultiServerSocketReadClient::toStringLocked() const {
  return fmt::format(
      "MultiServerSocketReadClient{{nextClientIndex={}, servers={}, currentClient={}}}",
      nextClientIndex_,
      protocol::toString(servers_),
      currentClient_ ? currentClient_->toString() : "null");
}

std::string toString(MultiServerSocketReadClient::State state) {
  switch (state) {
    case MultiServerSocketReadClient::State::kNotConnected:
      return "NOT_CONNECTED";
    case MultiServerSocketReadClient::State::kActive:
      return "ACTIVE";
    case MultiServerSocketReadClient::State::kFailed:
      return "FAILED";
    case MultiServerSocketReadClient::State::kAllExhausted:
      return "ALL_EXHAUSTED";
    case MultiServerSocketReadClient::State::kClosed:
      return "CLOSED";
  }
  RSS_UNREACHABLE("Unknown state {}", static_cast<int>(state));
}
} // namespace client
} // namespace rss
