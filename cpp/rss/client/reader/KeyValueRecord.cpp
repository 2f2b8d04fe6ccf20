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

#include "rss/client/reader/KeyValueRecord.h"

#include <fmt/format.h>

namespace rss {
namespace client {
namespace {
size_t payloadLength(const std::unique_ptr<folly::IOBuf>& payload) {
  return payload ? payload->computeChainDataLength() : 0;
}

std::string describePayload(const std::unique_ptr<folly::IOBuf>& payload) {
  if (!payload) {
    return "null";
  }
  return fmt::format("{} bytes", payload->computeChainDataLength());
}
} // namespace

KeyValueRecord::KeyValueRecord(
    int64_t taskAttemptId,
    std::unique_ptr<folly::IOBuf> key,
    std::unique_ptr<folly::IOBuf> value)
    : taskAttemptId_(taskAttemptId),
      key_(std::move(key)),
      value_(std::move(value)) {}

size_t KeyValueRecord::payloadSize() const {
  return payloadLength(key_) + payloadLength(value_);
}

std::string KeyValueRecord::toString() const {
  return fmt::format(
      "KeyValueRecord{{taskAttemptId={}, keyBuffer={}, valueBuffer={}}}",
      taskAttemptId_,
      describePayload(key_),
      describePayload(value_));
}
} // namespace client
} // namespace rss
