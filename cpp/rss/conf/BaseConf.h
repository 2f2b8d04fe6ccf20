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

#include <string>
#include <string_view>
#include <unordered_map>

#include <folly/Optional.h>
#include <folly/SharedMutex.h>

#include "rss/utils/Exceptions.h"

namespace rss {
namespace conf {
/// Registry of known property names. Only registered properties may be set,
/// either by setValue() or from a properties file via initialize().
class BaseConf {
 public:
  virtual ~BaseConf() = default;

  /// Loads "key=value" lines from a properties file. Lines starting with '#'
  /// and blank lines are ignored. Unknown keys are rejected.
  void initialize(const std::string& filePath);

  /// Registers a property (or overrides its default). Intended for
  /// subclasses and tests.
  void registerProperty(std::string_view propertyName, const std::string& value);

  /// Sets the value of a registered property and returns the previous one.
  folly::Optional<std::string> setValue(
      const std::string& propertyName,
      const std::string& value);

  folly::Optional<std::string> optionalProperty(
      std::string_view propertyName) const;

  std::string requiredProperty(std::string_view propertyName) const;

 protected:
  mutable folly::SharedMutex mutex_;
  std::unordered_map<std::string, folly::Optional<std::string>>
      registeredProps_;
};
} // namespace conf
} // namespace rss
