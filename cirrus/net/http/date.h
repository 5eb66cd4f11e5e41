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

#ifndef CIRRUS_NET_HTTP_DATE_H_
#define CIRRUS_NET_HTTP_DATE_H_

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace cirrus {

// Formats `time` as an HTTP-date (RFC 1123, always in GMT), e.g.
// `Sun, 06 Nov 1994 08:49:37 GMT`.
std::string FormatHttpDate(std::chrono::system_clock::time_point time);

// Parses an HTTP-date in the form produced by `FormatHttpDate`. Obsolete
// formats (RFC 850, asctime) are not recognized.
std::optional<std::chrono::system_clock::time_point> TryParseHttpDate(
    std::string_view s);

}  // namespace cirrus

#endif  // CIRRUS_NET_HTTP_DATE_H_
