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

#include "cirrus/net/http/date.h"

#include <time.h>

#include <chrono>
#include <string>

namespace cirrus {

namespace {

constexpr auto kHttpDateFormat = "%a, %d %b %Y %H:%M:%S GMT";

}  // namespace

std::string FormatHttpDate(std::chrono::system_clock::time_point time) {
  auto t = std::chrono::system_clock::to_time_t(time);
  struct tm tm;
  gmtime_r(&t, &tm);
  char buffer[64];
  auto len = strftime(buffer, sizeof(buffer), kHttpDateFormat, &tm);
  return std::string(buffer, len);
}

std::optional<std::chrono::system_clock::time_point> TryParseHttpDate(
    std::string_view s) {
  std::string str(s);  // Null-terminated.
  struct tm tm = {};
  auto end = strptime(str.c_str(), kHttpDateFormat, &tm);
  if (!end || *end != '\0') {
    return std::nullopt;
  }
  auto t = timegm(&tm);
  if (t == -1) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(t);
}

}  // namespace cirrus
