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

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <folly/Likely.h>

namespace rss {
namespace utils {
namespace error_source {
// The error is caused by the caller, e.g. bad input or configuration.
inline constexpr const char* kErrorSourceUser = "USER";

// The error is raised by this library or one of its collaborators.
inline constexpr const char* kErrorSourceRuntime = "RUNTIME";
} // namespace error_source

namespace error_code {
inline constexpr const char* kInvalidArgument = "INVALID_ARGUMENT";

inline constexpr const char* kInvalidState = "INVALID_STATE";

inline constexpr const char* kUnreachableCode = "UNREACHABLE_CODE";

// Retry budget for connecting to a server group ran out.
inline constexpr const char* kConnectionFailure = "CONNECTION_FAILURE";
} // namespace error_code

class RssException : public std::exception {
 public:
  enum class Type { kUser = 0, kSystem = 1 };

  RssException(
      const char* file,
      size_t line,
      const char* function,
      std::string_view failingExpression,
      std::string_view message,
      std::string_view errorSource,
      std::string_view errorCode,
      bool isRetriable,
      Type exceptionType = Type::kSystem,
      std::exception_ptr cause = nullptr);

  const char* what() const noexcept override {
    return what_.c_str();
  }

  const std::string& message() const {
    return message_;
  }

  const std::string& failingExpression() const {
    return failingExpression_;
  }

  const std::string& errorSource() const {
    return errorSource_;
  }

  const std::string& errorCode() const {
    return errorCode_;
  }

  bool isRetriable() const {
    return isRetriable_;
  }

  Type exceptionType() const {
    return exceptionType_;
  }

  const char* file() const {
    return file_;
  }

  size_t line() const {
    return line_;
  }

  const char* function() const {
    return function_;
  }

  // The failure this exception wraps, nullptr when there is none.
  const std::exception_ptr& cause() const {
    return cause_;
  }

 private:
  void buildWhat();

  const char* file_;
  size_t line_;
  const char* function_;
  std::string failingExpression_;
  std::string message_;
  std::string errorSource_;
  std::string errorCode_;
  bool isRetriable_;
  Type exceptionType_;
  std::exception_ptr cause_;
  std::string what_;
};

class RssUserError : public RssException {
 public:
  RssUserError(
      const char* file,
      size_t line,
      const char* function,
      std::string_view failingExpression,
      std::string_view message,
      std::string_view errorCode = error_code::kInvalidArgument,
      bool isRetriable = false,
      std::exception_ptr cause = nullptr)
      : RssException(
            file,
            line,
            function,
            failingExpression,
            message,
            error_source::kErrorSourceUser,
            errorCode,
            isRetriable,
            Type::kUser,
            std::move(cause)) {}
};

class RssRuntimeError : public RssException {
 public:
  RssRuntimeError(
      const char* file,
      size_t line,
      const char* function,
      std::string_view failingExpression,
      std::string_view message,
      std::string_view errorCode = error_code::kInvalidState,
      bool isRetriable = false,
      std::exception_ptr cause = nullptr)
      : RssException(
            file,
            line,
            function,
            failingExpression,
            message,
            error_source::kErrorSourceRuntime,
            errorCode,
            isRetriable,
            Type::kSystem,
            std::move(cause)) {}
};

// Returns the what() text of an exception_ptr, or "unknown exception" when it
// does not hold a std::exception.
std::string exceptionPtrStr(const std::exception_ptr& eptr);

inline std::string errorMessage() {
  return "";
}

inline std::string errorMessage(const char* message) {
  return message;
}

inline std::string errorMessage(const std::string& message) {
  return message;
}

template <typename... Args>
std::string errorMessage(fmt::string_view format, const Args&... args) {
  return fmt::vformat(format, fmt::make_format_args(args...));
}

template <typename T1, typename T2>
std::string checkOpMessage(
    const T1& lhs,
    const T2& rhs,
    const std::string& message) {
  if (message.empty()) {
    return fmt::format("({} vs. {})", lhs, rhs);
  }
  return fmt::format("({} vs. {}) {}", lhs, rhs, message);
}
} // namespace utils
} // namespace rss

#define _RSS_THROW(exception, expression, errorCode, message) \
  throw exception(                                             \
      __FILE__, __LINE__, __FUNCTION__, expression, message, errorCode)

#define RSS_CHECK(expr, ...)                              \
  do {                                                    \
    if (FOLLY_UNLIKELY(!(expr))) {                        \
      _RSS_THROW(                                         \
          ::rss::utils::RssRuntimeError,                  \
          #expr,                                          \
          ::rss::utils::error_code::kInvalidState,        \
          ::rss::utils::errorMessage(__VA_ARGS__));       \
    }                                                     \
  } while (0)

#define _RSS_CHECK_OP(expr1, expr2, op, ...)                              \
  do {                                                                    \
    const auto& _rss_lhs = (expr1);                                       \
    const auto& _rss_rhs = (expr2);                                       \
    if (FOLLY_UNLIKELY(!(_rss_lhs op _rss_rhs))) {                        \
      _RSS_THROW(                                                         \
          ::rss::utils::RssRuntimeError,                                  \
          #expr1 " " #op " " #expr2,                                      \
          ::rss::utils::error_code::kInvalidState,                        \
          ::rss::utils::checkOpMessage(                                   \
              _rss_lhs, _rss_rhs, ::rss::utils::errorMessage(__VA_ARGS__))); \
    }                                                                     \
  } while (0)

#define RSS_CHECK_EQ(e1, e2, ...) _RSS_CHECK_OP(e1, e2, ==, ##__VA_ARGS__)
#define RSS_CHECK_NE(e1, e2, ...) _RSS_CHECK_OP(e1, e2, !=, ##__VA_ARGS__)
#define RSS_CHECK_LT(e1, e2, ...) _RSS_CHECK_OP(e1, e2, <, ##__VA_ARGS__)
#define RSS_CHECK_LE(e1, e2, ...) _RSS_CHECK_OP(e1, e2, <=, ##__VA_ARGS__)
#define RSS_CHECK_GT(e1, e2, ...) _RSS_CHECK_OP(e1, e2, >, ##__VA_ARGS__)
#define RSS_CHECK_GE(e1, e2, ...) _RSS_CHECK_OP(e1, e2, >=, ##__VA_ARGS__)

#define RSS_CHECK_NOT_NULL(e, ...) \
  RSS_CHECK((e) != nullptr, ##__VA_ARGS__)

#define RSS_FAIL(...)                           \
  _RSS_THROW(                                   \
      ::rss::utils::RssRuntimeError,            \
      "",                                       \
      ::rss::utils::error_code::kInvalidState,  \
      ::rss::utils::errorMessage(__VA_ARGS__))

#define RSS_UNREACHABLE(...)                       \
  _RSS_THROW(                                      \
      ::rss::utils::RssRuntimeError,               \
      "",                                          \
      ::rss::utils::error_code::kUnreachableCode,  \
      ::rss::utils::errorMessage(__VA_ARGS__))

#define RSS_USER_CHECK(expr, ...)                          \
  do {                                                     \
    if (FOLLY_UNLIKELY(!(expr))) {                         \
      _RSS_THROW(                                          \
          ::rss::utils::RssUserError,                      \
          #expr,                                           \
          ::rss::utils::error_code::kInvalidArgument,      \
          ::rss::utils::errorMessage(__VA_ARGS__));        \
    }                                                      \
  } while (0)

#define RSS_USER_FAIL(...)                          \
  _RSS_THROW(                                       \
      ::rss::utils::RssUserError,                   \
      "",                                           \
      ::rss::utils::error_code::kInvalidArgument,   \
      ::rss::utils::errorMessage(__VA_ARGS__))
