// Copyright (C) 2021 THL A29 Limited, a Tencent company. All rights reserved.
//
// Licensed under the BSD 3-Clause License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of the
// License at
//
// https://opensource.org/licenses/BSD-3-Clause
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
// WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
// License for the specific language governing permissions and limitations under
// the License.

#ifndef CIRRUS_BASE_LOGGING_H_
#define CIRRUS_BASE_LOGGING_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "fmt/format.h"
#include "glog/logging.h"

#include "cirrus/base/likely.h"

// Logging macros. Messages are formatted with `fmt` and written via glog, e.g.:
//
//   CIRRUS_LOG_INFO("Deleting blob [{}] in container [{}].", blob, container);
//
// Available macros:
//
// CIRRUS_CHECK(expr, ...)
// CIRRUS_CHECK_EQ / _NE / _LE / _LT / _GE / _GT(val1, val2, ...)
// CIRRUS_DCHECK(expr, ...)
//
// CIRRUS_VLOG(n, ...)
// CIRRUS_LOG_INFO / _WARNING / _ERROR / _FATAL(...)
// CIRRUS_LOG_INFO_IF / _WARNING_IF / _ERROR_IF(expr, ...)
// CIRRUS_LOG_INFO_ONCE / _WARNING_ONCE / _ERROR_ONCE(...)
// CIRRUS_LOG_INFO_EVERY_SECOND / _WARNING_EVERY_SECOND /
//   _ERROR_EVERY_SECOND(...)
//
// CIRRUS_UNREACHABLE(...)
// CIRRUS_UNEXPECTED(...)

#define CIRRUS_CHECK(expr, ...) \
  CIRRUS_INTERNAL_DETAIL_LOGGING_CHECK(expr, ##__VA_ARGS__)
#define CIRRUS_CHECK_EQ(val1, val2, ...) \
  CIRRUS_INTERNAL_DETAIL_LOGGING_CHECK_OP(==, val1, val2, ##__VA_ARGS__)
#define CIRRUS_CHECK_NE(val1, val2, ...) \
  CIRRUS_INTERNAL_DETAIL_LOGGING_CHECK_OP(!=, val1, val2, ##__VA_ARGS__)
#define CIRRUS_CHECK_LE(val1, val2, ...) \
  CIRRUS_INTERNAL_DETAIL_LOGGING_CHECK_OP(<=, val1, val2, ##__VA_ARGS__)
#define CIRRUS_CHECK_LT(val1, val2, ...) \
  CIRRUS_INTERNAL_DETAIL_LOGGING_CHECK_OP(<, val1, val2, ##__VA_ARGS__)
#define CIRRUS_CHECK_GE(val1, val2, ...) \
  CIRRUS_INTERNAL_DETAIL_LOGGING_CHECK_OP(>=, val1, val2, ##__VA_ARGS__)
#define CIRRUS_CHECK_GT(val1, val2, ...) \
  CIRRUS_INTERNAL_DETAIL_LOGGING_CHECK_OP(>, val1, val2, ##__VA_ARGS__)

#ifndef NDEBUG
#define CIRRUS_DCHECK(expr, ...) CIRRUS_CHECK(expr, ##__VA_ARGS__)
#else
#define CIRRUS_DCHECK(expr, ...) \
  while (0) CIRRUS_CHECK(expr, ##__VA_ARGS__)
#endif

#define CIRRUS_VLOG(n, ...)                                         \
  LOG_IF(INFO, CIRRUS_UNLIKELY(VLOG_IS_ON(n)))                      \
      << ::cirrus::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                __VA_ARGS__)

#define CIRRUS_LOG_INFO(...)                                              \
  LOG(INFO) << ::cirrus::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                      __VA_ARGS__)
#define CIRRUS_LOG_WARNING(...)                                              \
  LOG(WARNING) << ::cirrus::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                         __VA_ARGS__)
#define CIRRUS_LOG_ERROR(...)                                              \
  LOG(ERROR) << ::cirrus::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                       __VA_ARGS__)
#define CIRRUS_LOG_FATAL(...)                                                \
  do {                                                                       \
    LOG(FATAL) << ::cirrus::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                         __VA_ARGS__);       \
  } while (0);                                                               \
  CIRRUS_UNREACHABLE()

#define CIRRUS_LOG_INFO_IF(expr, ...)                           \
  LOG_IF(INFO, expr) << ::cirrus::internal::logging::FormatLog( \
      __FILE__, __LINE__, __VA_ARGS__)
#define CIRRUS_LOG_WARNING_IF(expr, ...)                            \
  LOG_IF(WARNING, CIRRUS_UNLIKELY(expr))                            \
      << ::cirrus::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                __VA_ARGS__)
#define CIRRUS_LOG_ERROR_IF(expr, ...)                              \
  LOG_IF(ERROR, CIRRUS_UNLIKELY(expr))                              \
      << ::cirrus::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                __VA_ARGS__)

#define CIRRUS_LOG_INFO_ONCE(...) \
  CIRRUS_INTERNAL_DETAIL_LOG_ONCE(INFO, __VA_ARGS__)
#define CIRRUS_LOG_WARNING_ONCE(...) \
  CIRRUS_INTERNAL_DETAIL_LOG_ONCE(WARNING, __VA_ARGS__)
#define CIRRUS_LOG_ERROR_ONCE(...) \
  CIRRUS_INTERNAL_DETAIL_LOG_ONCE(ERROR, __VA_ARGS__)

// Inspired by brpc's `LOG_EVERY_SECOND`.
#define CIRRUS_LOG_INFO_EVERY_SECOND(...) \
  CIRRUS_INTERNAL_DETAIL_LOG_EVERY_SECOND(INFO, __VA_ARGS__)
#define CIRRUS_LOG_WARNING_EVERY_SECOND(...) \
  CIRRUS_INTERNAL_DETAIL_LOG_EVERY_SECOND(WARNING, __VA_ARGS__)
#define CIRRUS_LOG_ERROR_EVERY_SECOND(...) \
  CIRRUS_INTERNAL_DETAIL_LOG_EVERY_SECOND(ERROR, __VA_ARGS__)

#define CIRRUS_UNREACHABLE(...)                                                \
  do {                                                                         \
    [&]() CIRRUS_INTERNAL_DETAIL_LOGGING_ATTRIBUTE_NORETURN_NOINLINE_COLD {    \
      LOG(FATAL) << "UNREACHABLE. "                                            \
                 << ::cirrus::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                           ##__VA_ARGS__);     \
      __builtin_unreachable();                                                 \
    }();                                                                       \
  } while (0)
#define CIRRUS_UNEXPECTED(...)                                                 \
  do {                                                                         \
    [&]() CIRRUS_INTERNAL_DETAIL_LOGGING_ATTRIBUTE_NORETURN_NOINLINE_COLD {    \
      LOG(FATAL) << "UNEXPECTED. "                                             \
                 << ::cirrus::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                           ##__VA_ARGS__);     \
      __builtin_unreachable();                                                 \
    }();                                                                       \
  } while (0)

///////////////////////////////////////
// Implementation goes below.        //
///////////////////////////////////////

// C++ attribute won't work on lambdas here.
#define CIRRUS_INTERNAL_DETAIL_LOGGING_ATTRIBUTE_NOINLINE_COLD \
  __attribute__((noinline, cold))
#define CIRRUS_INTERNAL_DETAIL_LOGGING_ATTRIBUTE_NORETURN_NOINLINE_COLD \
  __attribute__((noreturn, noinline, cold))

namespace cirrus::internal::logging {

namespace details {

// Converts `value` to string. Used for describing operands of failed checks,
// and for dumping arguments when `FormatLog` fails.
template <class T>
std::string ToString(const T& value) {
  if constexpr (std::is_enum_v<T>) {
    return fmt::format("{}", static_cast<std::underlying_type_t<T>>(value));
  } else if constexpr (fmt::is_formattable<T>::value) {
    return fmt::format("{}", value);
  } else {
    return "(unprintable)";
  }
}

std::string DescribeFormatArguments(const std::vector<std::string>& args);

inline std::int64_t ReadSteadyClockMs() noexcept {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

}  // namespace details

inline std::string FormatLog([[maybe_unused]] const char* file,
                             [[maybe_unused]] int line) noexcept {
  return {};
}

// Throwing in formatting log is likely a programming error, but aborting the
// whole program because of a mal-formatted log message doesn't feel right.
template <class... Ts>
std::string FormatLog(const char* file, int line, std::string_view format,
                      const Ts&... args) noexcept {
  try {
    return fmt::format(fmt::runtime(format), args...);
  } catch (const std::exception& xcpt) {
    return fmt::format(
        "Failed to format log at [{}:{}] with arguments ({}): {}", file, line,
        details::DescribeFormatArguments(
            {std::string(format), details::ToString(args)...}),
        xcpt.what());
  }
}

}  // namespace cirrus::internal::logging

#define CIRRUS_INTERNAL_DETAIL_LOGGING_CHECK(expr, ...)                       \
  do {                                                                        \
    if (CIRRUS_UNLIKELY(!(expr))) {                                           \
      [&]() CIRRUS_INTERNAL_DETAIL_LOGGING_ATTRIBUTE_NORETURN_NOINLINE_COLD { \
        ::google::LogMessage(__FILE__, __LINE__, ::google::GLOG_FATAL)        \
                .stream()                                                     \
            << "Check failed: " #expr " "                                     \
            << ::cirrus::internal::logging::FormatLog(__FILE__, __LINE__,     \
                                                      ##__VA_ARGS__);         \
        __builtin_unreachable();                                              \
      }();                                                                    \
    }                                                                         \
  } while (0)

// Operands are evaluated exactly once, inside an IIFE. `auto&& x = (val1)`
// would dangle if `val1` refers into a temporary.
#define CIRRUS_INTERNAL_DETAIL_LOGGING_CHECK_OP(op, val1, val2, ...)          \
  [&](auto&& cirrus_anonymous_x, auto&& cirrus_anonymous_y) {                 \
    if (CIRRUS_UNLIKELY(!(cirrus_anonymous_x op cirrus_anonymous_y))) {       \
      [&]() CIRRUS_INTERNAL_DETAIL_LOGGING_ATTRIBUTE_NORETURN_NOINLINE_COLD { \
        ::google::LogMessage(__FILE__, __LINE__, ::google::GLOG_FATAL)        \
                .stream()                                                     \
            << "Check failed: " #val1 " " #op " " #val2 " ("                  \
            << ::cirrus::internal::logging::details::ToString(                \
                   cirrus_anonymous_x)                                        \
            << " vs. "                                                        \
            << ::cirrus::internal::logging::details::ToString(                \
                   cirrus_anonymous_y)                                        \
            << ") "                                                           \
            << ::cirrus::internal::logging::FormatLog(__FILE__, __LINE__,     \
                                                      ##__VA_ARGS__);         \
        __builtin_unreachable();                                              \
      }();                                                                    \
    }                                                                         \
  }((val1), (val2))

#define CIRRUS_INTERNAL_DETAIL_LOG_ONCE(Level, ...)                      \
  do {                                                                   \
    static std::atomic<bool> cirrus_anonymous_logged{false};             \
    if (CIRRUS_UNLIKELY(                                                 \
            !cirrus_anonymous_logged.load(std::memory_order_relaxed))) { \
      [&]() CIRRUS_INTERNAL_DETAIL_LOGGING_ATTRIBUTE_NOINLINE_COLD {     \
        if (!cirrus_anonymous_logged.exchange(true)) {                   \
          LOG(Level) << ::cirrus::internal::logging::FormatLog(          \
              __FILE__, __LINE__, __VA_ARGS__);                          \
        }                                                                \
      }();                                                               \
    }                                                                    \
  } while (0)

#define CIRRUS_INTERNAL_DETAIL_LOG_EVERY_SECOND(Level, ...)                   \
  do {                                                                        \
    static std::atomic<std::int64_t> cirrus_anonymous_last_logged{-1000000};  \
    auto cirrus_anonymous_now =                                               \
        ::cirrus::internal::logging::details::ReadSteadyClockMs();            \
    auto cirrus_anonymous_last =                                              \
        cirrus_anonymous_last_logged.load(std::memory_order_relaxed);         \
    if (CIRRUS_UNLIKELY(cirrus_anonymous_now - cirrus_anonymous_last >=       \
                        1000) &&                                              \
        cirrus_anonymous_last_logged.compare_exchange_strong(                 \
            cirrus_anonymous_last, cirrus_anonymous_now,                      \
            std::memory_order_relaxed)) {                                     \
      LOG(Level) << ::cirrus::internal::logging::FormatLog(__FILE__, __LINE__, \
                                                           __VA_ARGS__);      \
    }                                                                         \
  } while (0)

#endif  // CIRRUS_BASE_LOGGING_H_
