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

#include <charconv>
#include <chrono>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "rss/utils/Exceptions.h"

namespace rss {
namespace utils {
std::string makeShuffleKey(const std::string& appId, int shuffleId);

using Duration = std::chrono::duration<double>;
using Timeout = std::chrono::milliseconds;
inline Timeout toTimeout(Duration duration) {
  return std::chrono::duration_cast<Timeout>(duration);
}

/// parse string like "Any-Host-Str:Port#1:Port#2:...:Port#num", split into
/// {"Any-Host-Str", "Port#1", "Port#2", ..., "Port#num"}. Note that the
/// "Any-Host_Str" might contain ':' in IPV6 address.
std::vector<std::string_view> parseColonSeparatedHostPorts(
    const std::string_view& s,
    int num);

std::vector<std::string_view> explode(const std::string_view& s, char delim);

/// Splits at the first occurrence of delim. When delim is absent the second
/// element is empty.
std::tuple<std::string_view, std::string_view> split(
    const std::string_view& s,
    char delim);

template <class T>
T strv2val(const std::string_view& s) {
  T t;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  std::from_chars_result res = std::from_chars(first, last, t);

  // These two exceptions reflect the behavior of std::stoi.
  if (res.ec == std::errc::invalid_argument) {
    RSS_USER_FAIL("Invalid argument when parsing '{}'", s);
  } else if (res.ec == std::errc::result_out_of_range) {
    RSS_USER_FAIL("Out of range when parsing '{}'", s);
  }
  RSS_USER_CHECK(res.ptr == last, "Trailing characters when parsing '{}'", s);
  return t;
}
} // namespace utils
} // namespace rss
