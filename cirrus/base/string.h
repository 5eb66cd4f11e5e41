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

#ifndef CIRRUS_BASE_STRING_H_
#define CIRRUS_BASE_STRING_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fmt/format.h"

namespace cirrus {

// Specialized by types that can be parsed from their wire representation
// (e.g. header values, command-line flags).
template <class T, class = void>
struct TryParseTraits;

// `std::nullopt` if `s` is not a valid representation of `T`.
template <class T, class... Args>
inline std::optional<T> TryParse(std::string_view s, const Args&... args) {
  return TryParseTraits<T>::TryParse(s, args...);
}

template <class... Args>
std::string Format(std::string_view fmt, Args&&... args) {
  return fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
}

bool StartsWith(std::string_view s, std::string_view prefix);
bool EndsWith(std::string_view s, std::string_view suffix);

// Strips leading and trailing whitespace.
std::string_view Trim(std::string_view str);

// Empty pieces are dropped unless `keep_empty` is set.
std::vector<std::string_view> Split(std::string_view s, char delim,
                                    bool keep_empty = false);

// ASCII case-insensitive equality.
bool IEquals(std::string_view first, std::string_view second);

}  // namespace cirrus

#endif  // CIRRUS_BASE_STRING_H_
