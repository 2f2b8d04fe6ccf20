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

#include "rss/conf/BaseConf.h"

#include <fstream>
#include <mutex>
#include <shared_mutex>

#include <folly/String.h>

#include "rss/utils/RssUtils.h"

namespace rss {
namespace conf {
void BaseConf::initialize(const std::string& filePath) {
  std::ifstream file(filePath);
  RSS_USER_CHECK(file.is_open(), "Failed to open config file {}", filePath);

  std::string line;
  int lineNumber = 0;
  while (std::getline(file, line)) {
    lineNumber++;
    auto trimmed = folly::trimWhitespace(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    auto [key, value] = utils::split(
        std::string_view(trimmed.data(), trimmed.size()), '=');
    auto name =
        folly::trimWhitespace(folly::StringPiece(key.data(), key.size())).str();
    RSS_USER_CHECK(
        !name.empty() && key.size() < trimmed.size(),
        "Malformed property at {}:{}: '{}'",
        filePath,
        lineNumber,
        line);
    setValue(
        name,
        folly::trimWhitespace(folly::StringPiece(value.data(), value.size()))
            .str());
  }
}

void BaseConf::registerProperty(
    std::string_view propertyName,
    const std::string& value) {
  std::unique_lock<folly::SharedMutex> l(mutex_);
  registeredProps_[std::string(propertyName)] = value;
}

folly::Optional<std::string> BaseConf::setValue(
    const std::string& propertyName,
    const std::string& value) {
  std::unique_lock<folly::SharedMutex> l(mutex_);
  auto it = registeredProps_.find(propertyName);
  RSS_USER_CHECK(
      it != registeredProps_.end(),
      "Setting unregistered config property '{}'",
      propertyName);
  auto oldValue = it->second;
  it->second = value;
  return oldValue;
}

folly::Optional<std::string> BaseConf::optionalProperty(
    std::string_view propertyName) const {
  std::shared_lock<folly::SharedMutex> l(mutex_);
  auto it = registeredProps_.find(std::string(propertyName));
  if (it == registeredProps_.end()) {
    return folly::none;
  }
  return it->second;
}

std::string BaseConf::requiredProperty(std::string_view propertyName) const {
  auto value = optionalProperty(propertyName);
  RSS_USER_CHECK(
      value.has_value(), "Missing required config property '{}'", propertyName);
  return value.value();
}
} // namespace conf
} // namespace rss
