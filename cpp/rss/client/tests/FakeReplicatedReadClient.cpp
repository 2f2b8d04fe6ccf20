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

#include "rss/client/tests/FakeReplicatedReadClient.h"

#include "rss/utils/Exceptions.h"

namespace rss {
namespace client {
namespace test {
FakeReplicatedReadClient::FakeReplicatedReadClient(
    FakeReplicatedReadClientFactory& factory,
    std::string groupId,
    const FakeGroupScript& script,
    bool failConnect)
    : factory_(factory),
      groupId_(std::move(groupId)),
      script_(script),
      failConnect_(failConnect) {
  factory_.updateJournal(groupId_, [](GroupJournal& journal) {
    journal.createCount++;
    journal.liveClients++;
  });
}

void FakeReplicatedReadClient::connect() {
  if (failConnect_) {
    if (script_.failureKind == FakeGroupScript::FailureKind::kRssError) {
      throw utils::RssUserError(
          __FILE__,
          __LINE__,
          __FUNCTION__,
          "",
          "replica mismatch on " + groupId_,
          "REPLICA_MISMATCH");
    }
    if (script_.failureKind == FakeGroupScript::FailureKind::kForeignError) {
      throw FakeTransportFault{"connect " + groupId_};
    }
    throw std::runtime_error("connection refused by " + groupId_);
  }
  connected_ = true;
  factory_.updateJournal(
      groupId_, [](GroupJournal& journal) { journal.connectCount++; });
}

std::optional<KeyValueRecord> FakeReplicatedReadClient::readRecord() {
  RSS_CHECK(connected_ && !closed_, "{} is not open", toString());
  if (script_.failReadAfter >= 0 &&
      position_ == static_cast<size_t>(script_.failReadAfter)) {
    throw std::runtime_error("stream broken on " + groupId_);
  }
  if (position_ >= script_.records.size()) {
    return std::nullopt;
  }
  const auto& fake = script_.records[position_++];
  auto key = fake.key ? folly::IOBuf::copyBuffer(*fake.key) : nullptr;
  auto value = fake.value ? folly::IOBuf::copyBuffer(*fake.value) : nullptr;
  std::optional<KeyValueRecord> record(
      std::in_place, fake.taskAttemptId, std::move(key), std::move(value));
  auto size = static_cast<int64_t>(record->payloadSize());
  bytesRead_ += size;
  factory_.updateJournal(
      groupId_, [size](GroupJournal& journal) { journal.bytesRead += size; });
  return record;
}

void FakeReplicatedReadClient::close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  factory_.updateJournal(groupId_, [](GroupJournal& journal) {
    journal.closeCount++;
    journal.liveClients--;
  });
  if (!script_.failOnClose) {
    return;
  }
  if (script_.closeFailureKind ==
      FakeGroupScript::FailureKind::kForeignError) {
    throw FakeTransportFault{"close " + groupId_};
  }
  throw std::runtime_error("close failed on " + groupId_);
}

std::unique_ptr<ReplicatedReadClient>
FakeReplicatedReadClientFactory::createClient(
    const protocol::ServerReplicationGroup& group,
    const ReadClientOptions& options) {
  RSS_CHECK(!group.servers.empty());
  const auto& groupId = group.servers.front().serverId;
  const FakeGroupScript* script;
  int attempt;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    lastOptions_ = options;
    auto it = scripts_.find(groupId);
    RSS_CHECK(it != scripts_.end(), "No script for group {}", groupId);
    script = &it->second;
    attempt = journals_[groupId].attemptCount++;
  }
  bool failing =
      script->failingConnects < 0 || attempt < script->failingConnects;
  if (failing &&
      script->failureKind == FakeGroupScript::FailureKind::kNoClient) {
    return nullptr;
  }
  return std::make_unique<FakeReplicatedReadClient>(
      *this, groupId, *script, failing);
}
} // namespace test
} // namespace client
} // namespace rss
