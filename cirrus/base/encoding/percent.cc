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

#include "cirrus/base/encoding/percent.h"

#include <string>
#include <string_view>

using namespace std::literals;

namespace cirrus {

namespace {

constexpr auto kHexDigits = "0123456789ABCDEF"sv;

bool IsUnreserved(unsigned char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
         (c >= 'A' && c <= 'Z') || c == '-' || c == '.' || c == '_' ||
         c == '~';
}

}  // namespace

std::string EncodePercent(std::string_view from) {
  std::string result;
  result.reserve(from.size());
  for (auto&& e : from) {
    auto c = static_cast<unsigned char>(e);
    if (IsUnreserved(c)) {
      result.push_back(e);
    } else {
      // RFC 3986 recommends uppercase hex digits.
      result.append({'%', kHexDigits[c >> 4], kHexDigits[c & 0xF]});
    }
  }
  return result;
}

}  // namespace cirrus
