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

#include "rss/conf/RssConf.h"

#include <folly/Conv.h>
#include <re2/re2.h>

namespace rss {
namespace conf {
namespace {

// folly::to<> does not generate 'true' and 'false', so we do it ourselves.
std::string bool2String(bool value) {
  return value ? "true" : "false";
}

#define STR_PROP(_key_, _val_) \
  { std::string(_key_), std::string(_val_) }
#define NUM_PROP(_key_, _val_) \
  { std::string(_key_), folly::to<std::string>(_val_) }
#define BOOL_PROP(_key_, _val_) \
  { std::string(_key_), bool2String(_val_) }

} // namespace

utils::Duration toDuration(const std::string& str) {
  static const RE2 kPattern(R"(^\s*(\d+(?:\.\d+)?)\s*([a-zA-Z]+)\s*$)");

  double value;
  std::string unit;
  if (!RE2::FullMatch(str, kPattern, &value, &unit)) {
    RSS_USER_FAIL("Invalid duration {}", str);
  }
  if (unit == "ns") {
    return std::chrono::duration<double, std::nano>(value);
  } else if (unit == "us") {
    return std::chrono::duration<double, std::micro>(value);
  } else if (unit == "ms") {
    return std::chrono::duration<double, std::milli>(value);
  } else if (unit == "s") {
    return utils::Duration(value);
  } else if (unit == "m") {
    return std::chrono::duration<double, std::ratio<60>>(value);
  } else if (unit == "h") {
    return std::chrono::duration<double, std::ratio<60 * 60>>(value);
  } else if (unit == "d") {
    return std::chrono::duration<double, std::ratio<60 * 60 * 24>>(value);
  }
  RSS_USER_FAIL("Invalid duration {}", str);
}

bool toBool(const std::string& str) {
  if (str == "true") {
    return true;
  }
  if (str == "false") {
    return false;
  }
  RSS_USER_FAIL("Invalid boolean '{}'", str);
}

RssConf::RssConf() {
  registeredProps_ =
      std::unordered_map<std::string, folly::Optional<std::string>>{
          STR_PROP(kNetworkTimeout, "30s"),
          STR_PROP(kReadRetryInterval, "1s"),
          STR_PROP(kReadRetryMaxWait, "180s"),
          STR_PROP(kReadDataAvailablePollInterval, "200ms"),
          STR_PROP(kReadDataAvailableWaitTime, "180s"),
          NUM_PROP(kReadQueueSize, 1000),
          BOOL_PROP(kReadCompressed, true),
          BOOL_PROP(kReadCheckReplicaConsistency, true),
      };
}

utils::Timeout RssConf::networkTimeout() const {
  return utils::toTimeout(toDuration(requiredProperty(kNetworkTimeout)));
}

utils::Timeout RssConf::readRetryInterval() const {
  return utils::toTimeout(toDuration(requiredProperty(kReadRetryInterval)));
}

utils::Timeout RssConf::readRetryMaxWait() const {
  return utils::toTimeout(toDuration(requiredProperty(kReadRetryMaxWait)));
}

utils::Timeout RssConf::readDataAvailablePollInterval() const {
  return utils::toTimeout(
      toDuration(requiredProperty(kReadDataAvailablePollInterval)));
}

utils::Timeout RssConf::readDataAvailableWaitTime() const {
  return utils::toTimeout(
      toDuration(requiredProperty(kReadDataAvailableWaitTime)));
}

int RssConf::readQueueSize() const {
  return utils::strv2val<int>(requiredProperty(kReadQueueSize));
}

bool RssConf::readCompressed() const {
  return toBool(requiredProperty(kReadCompressed));
}

bool RssConf::readCheckReplicaConsistency() const {
  return toBool(requiredProperty(kReadCheckReplicaConsistency));
}
} // namespace conf
} // namespace rss
