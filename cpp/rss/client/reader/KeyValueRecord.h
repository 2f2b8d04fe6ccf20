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

#include <cstdint>
#include <memory>
#include <string>

#include <folly/io/IOBuf.h>

namespace rss {
namespace client {
/// One shuffle record. The key and the value are each optional: a writer may
/// emit a record with an empty key or an empty value.
class KeyValueRecord {
 public:
  KeyValueRecord(
      int64_t taskAttemptId,
      std::unique_ptr<folly::IOBuf> key,
      std::unique_ptr<folly::IOBuf> value);

  KeyValueRecord(KeyValueRecord&&) = default;

  KeyValueRecord& operator=(KeyValueRecord&&) = default;

  int64_t taskAttemptId() const {
    return taskAttemptId_;
  }

  bool hasKey() const {
    return key_ != nullptr;
  }

  bool hasValue() const {
    return value_ != nullptr;
  }

  // nullptr when absent.
  const folly::IOBuf* key() const {
    return key_.get();
  }

  // nullptr when absent.
  const folly::IOBuf* value() const {
    return value_.get();
  }

  std::unique_ptr<folly::IOBuf> releaseKey() {
    return std::move(key_);
  }

  std::unique_ptr<folly::IOBuf> releaseValue() {
    return std::move(value_);
  }

  // Total length of the key and value payloads.
  size_t payloadSize() const;

  std::string toString() const;

 private:
  int64_t taskAttemptId_;
  std::unique_ptr<folly::IOBuf> key_;
  std::unique_ptr<folly::IOBuf> value_;
};
} // namespace client
} // namespace rss
