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

#include "rss/conf/BaseConf.h"
#include "rss/utils/RssUtils.h"

namespace rss {
namespace conf {
/***
 * steps to add a new config:
 * === in RssConf.h:
 *     1. define the configName with "static constexpr std::string_view";
 *     2. declare the getter method within class;
 * === in RssConf.cpp:
 *     3. register the configName in RssConf's constructor, with proper
 *        data type and proper default value;
 *     4. implement the getter method.
 */

class RssConf : public BaseConf {
 public:
  static constexpr std::string_view kNetworkTimeout{
      "rss.client.network.timeout"};

  static constexpr std::string_view kReadRetryInterval{
      "rss.client.read.retryInterval"};

  static constexpr std::string_view kReadRetryMaxWait{
      "rss.client.read.retryMaxWait"};

  static constexpr std::string_view kReadDataAvailablePollInterval{
      "rss.client.read.dataAvailablePollInterval"};

  static constexpr std::string_view kReadDataAvailableWaitTime{
      "rss.client.read.dataAvailableWaitTime"};

  static constexpr std::string_view kReadQueueSize{"rss.client.read.queueSize"};

  static constexpr std::string_view kReadCompressed{
      "rss.client.read.compressed"};

  static constexpr std::string_view kReadCheckReplicaConsistency{
      "rss.client.read.checkReplicaConsistency"};

  RssConf();

  utils::Timeout networkTimeout() const;

  utils::Timeout readRetryInterval() const;

  utils::Timeout readRetryMaxWait() const;

  utils::Timeout readDataAvailablePollInterval() const;

  utils::Timeout readDataAvailableWaitTime() const;

  int readQueueSize() const;

  bool readCompressed() const;

  bool readCheckReplicaConsistency() const;
};

/// Parses a duration string such as "200ms", "1.5s" or "3m".
utils::Duration toDuration(const std::string& str);

bool toBool(const std::string& str);
} // namespace conf
} // namespace rss
