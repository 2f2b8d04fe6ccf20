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

#include "rss/client/ClientRetryOptions.h"

#include <fmt/chrono.h>

namespace rss {
namespace client {
ClientRetryOptions::ClientRetryOptions(
    utils::Timeout retryInterval,
    utils::Timeout retryMaxWait,
    ServerDetailResolver serverDetailResolver)
    : retryInterval_(retryInterval),
      retryMaxWait_(retryMaxWait),
      serverDetailResolver_(std::move(serverDetailResolver)) {
  RSS_USER_CHECK(
      serverDetailResolver_ != nullptr, "serverDetailResolver must be set");
}

ClientRetryOptions ClientRetryOptions::fromConf(const conf::RssConf& conf) {
  return ClientRetryOptions(conf.readRetryInterval(), conf.readRetryMaxWait());
}

ServerDetailResolver ClientRetryOptions::identityResolver() {
  return [](const protocol::ServerDetail& server) { return server; };
}

std::string ClientRetryOptions::toString() const {
  return fmt::format(
      "ClientRetryOptions{{retryInterval={}, retryIntervalCap={}, retryMaxWait={}}}",
      retryInterval_,
      retryIntervalCap(),
      retryMaxWait_);
}
} // namespace client
} // namespace rss
