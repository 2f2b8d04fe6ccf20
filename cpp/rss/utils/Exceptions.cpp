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

#include "rss/utils/Exceptions.h"

#include <iterator>

#include <gflags/gflags.h>

DECLARE_bool(rss_exception_include_location);

namespace rss {
namespace utils {
RssException::RssException(
    const char* file,
    size_t line,
    const char* function,
    std::string_view failingExpression,
    std::string_view message,
    std::string_view errorSource,
    std::string_view errorCode,
    bool isRetriable,
    Type exceptionType,
    std::exception_ptr cause)
    : file_(file),
      line_(line),
      function_(function),
      failingExpression_(failingExpression),
      message_(message),
      errorSource_(errorSource),
      errorCode_(errorCode),
      isRetriable_(isRetriable),
      exceptionType_(exceptionType),
      cause_(std::move(cause)) {
  buildWhat();
}

void RssException::buildWhat() {
  fmt::memory_buffer buf;
  auto out = std::back_inserter(buf);
  fmt::format_to(
      out,
      "Exception: {}\nError Source: {}\nError Code: {}\n",
      exceptionType_ == Type::kUser ? "RssUserError" : "RssRuntimeError",
      errorSource_,
      errorCode_);
  if (!message_.empty()) {
    fmt::format_to(out, "Reason: {}\n", message_);
  }
  fmt::format_to(out, "Retriable: {}\n", isRetriable_ ? "True" : "False");
  if (!failingExpression_.empty()) {
    fmt::format_to(out, "Expression: {}\n", failingExpression_);
  }
  if (cause_) {
    fmt::format_to(out, "Caused by: {}\n", exceptionPtrStr(cause_));
  }
  if (FLAGS_rss_exception_include_location) {
    fmt::format_to(
        out, "Function: {}\nFile: {}\nLine: {}\n", function_, file_, line_);
  }
  what_ = fmt::to_string(buf);
}

std::string exceptionPtrStr(const std::exception_ptr& eptr) {
  if (!eptr) {
    return "null";
  }
  try {
    std::rethrow_exception(eptr);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}
} // namespace utils
} // namespace rss
