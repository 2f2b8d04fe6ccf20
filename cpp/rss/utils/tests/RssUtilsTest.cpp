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

#include <gtest/gtest.h>

#include "rss/utils/RssUtils.h"

using namespace rss::utils;

TEST(ExceptionsTest, checkFailureCarriesExpressionAndMessage) {
  int groups = 0;
  try {
    RSS_CHECK(groups > 0, "need at least {} group(s), got {}", 1, groups);
    FAIL() << "expected RssRuntimeError";
  } catch (const RssRuntimeError& e) {
    EXPECT_EQ(e.failingExpression(), "groups > 0");
    EXPECT_EQ(e.message(), "need at least 1 group(s), got 0");
    EXPECT_EQ(e.errorSource(), error_source::kErrorSourceRuntime);
    EXPECT_EQ(e.errorCode(), error_code::kInvalidState);
    EXPECT_EQ(e.exceptionType(), RssException::Type::kSystem);
    EXPECT_FALSE(e.isRetriable());
    EXPECT_NE(std::string(e.what()).find("Reason: need at least"), std::string::npos);
  }
}

TEST(ExceptionsTest, checkOpFormatsBothOperands) {
  size_t index = 4;
  size_t size = 3;
  try {
    RSS_CHECK_LT(index, size, "index out of range");
    FAIL() << "expected RssRuntimeError";
  } catch (const RssRuntimeError& e) {
    EXPECT_EQ(e.failingExpression(), "index < size");
    EXPECT_EQ(e.message(), "(4 vs. 3) index out of range");
  }
  EXPECT_NO_THROW(RSS_CHECK_LT(size, index));
  EXPECT_THROW(RSS_CHECK_EQ(index, size), RssRuntimeError);
}

TEST(ExceptionsTest, userErrorsHaveUserSource) {
  try {
    RSS_USER_FAIL("Invalid duration {}", "5 parsecs");
    FAIL() << "expected RssUserError";
  } catch (const RssUserError& e) {
    EXPECT_EQ(e.message(), "Invalid duration 5 parsecs");
    EXPECT_EQ(e.errorSource(), error_source::kErrorSourceUser);
    EXPECT_EQ(e.errorCode(), error_code::kInvalidArgument);
    EXPECT_EQ(e.exceptionType(), RssException::Type::kUser);
  }
  EXPECT_THROW(RSS_USER_CHECK(false), RssUserError);
  EXPECT_THROW(RSS_UNREACHABLE(), RssRuntimeError);
}

TEST(ExceptionsTest, causeIsKeptAndDescribed) {
  auto cause = std::make_exception_ptr(std::runtime_error("socket closed"));
  RssRuntimeError error(
      __FILE__,
      __LINE__,
      __FUNCTION__,
      "",
      "Failed to connect",
      error_code::kConnectionFailure,
      true,
      cause);
  EXPECT_EQ(error.cause(), cause);
  EXPECT_TRUE(error.isRetriable());
  EXPECT_EQ(exceptionPtrStr(error.cause()), "socket closed");
  EXPECT_NE(
      std::string(error.what()).find("Caused by: socket closed"),
      std::string::npos);
  EXPECT_EQ(exceptionPtrStr(nullptr), "null");
}

TEST(RssUtilsTest, makeShuffleKey) {
  EXPECT_EQ(makeShuffleKey("app-1", 3), "app-1-3");
}

TEST(RssUtilsTest, parseHostPorts) {
  auto parsed = parseColonSeparatedHostPorts("host-1:19000", 1);
  ASSERT_EQ(parsed.size(), 2u);
  EXPECT_EQ(parsed[0], "host-1");
  EXPECT_EQ(parsed[1], "19000");

  auto ipv6 = parseColonSeparatedHostPorts("fe80::1:19000:19001", 2);
  ASSERT_EQ(ipv6.size(), 3u);
  EXPECT_EQ(ipv6[0], "fe80::1");
  EXPECT_EQ(ipv6[1], "19000");
  EXPECT_EQ(ipv6[2], "19001");

  EXPECT_THROW(parseColonSeparatedHostPorts("host-only", 1), RssUserError);
}

TEST(RssUtilsTest, explodeAndSplit) {
  auto parts = explode("a:b:c", ':');
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[2], "c");

  auto [key, value] = split("key=a=b", '=');
  EXPECT_EQ(key, "key");
  EXPECT_EQ(value, "a=b");

  auto [noDelim, empty] = split("plain", '=');
  EXPECT_EQ(noDelim, "plain");
  EXPECT_TRUE(empty.empty());
}

TEST(RssUtilsTest, strv2val) {
  EXPECT_EQ(strv2val<int>("19000"), 19000);
  EXPECT_THROW(strv2val<int>("port"), RssUserError);
  EXPECT_THROW(strv2val<int>("99999999999"), RssUserError);
  EXPECT_THROW(strv2val<int>("12ab"), RssUserError);
}

TEST(RssUtilsTest, toTimeout) {
  EXPECT_EQ(toTimeout(Duration(1.5)), std::chrono::milliseconds(1500));
}
