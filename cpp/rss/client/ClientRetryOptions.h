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

#include <functional>
#include <string>

#include "rss/conf/RssConf.h"
#include "rss/protocol/ServerReplicationGroup.h"
#include "rss/utils/RssUtils.h"

namespace rss {
namespace client {
/// Maps a server to its latest known address, e.g. after the server
/// restarted on another host.
using ServerDetailResolver =
    std::function<protocol::ServerDetail(const protocol::ServerDetail&)>;

class ClientRetryOptions {
 public:
  static constexpr int kRetryIntervalCapMultiplier = 10;

  ClientRetryOptions(
      utils::Timeout retryInterval,
      utils::Timeout retryMaxWait,
      ServerDetailResolver serverDetailResolver = identityResolver());

  static ClientRetryOptions fromConf(const conf::RssConf& conf);

  static ServerDetailResolver identityResolver();

  utils::Timeout retryInterval() const {
    return retryInterval_;
  }

  // The sleep between two attempts never grows beyond this.
  utils::Timeout retryIntervalCap() const {
    return retryInterval_ * kRetryIntervalCapMultiplier;
  }

  utils::Timeout retryMaxWait() const {
    return retryMaxWait_;
  }

  const ServerDetailResolver& serverDetailResolver() const {
    return serverDetailResolver_;
  }

  std::string toString() const;

 private:
  utils::Timeout retryInterval_;
  utils::Timeout retryMaxWait_;
  ServerDetailResolver serverDetailResolver_;
};
} // namespace client
} // namespace rss
