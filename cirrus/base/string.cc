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

#include "cirrus/base/string.h"

#include <cstddef>
#include <string_view>
#include <vector>

namespace cirrus {

namespace {

char AsciiToLower(char c) {
  return (c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c;
}

}  // namespace

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

bool EndsWith(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string_view Trim(std::string_view str) {
  constexpr std::string_view kWhitespaces = " \t\r\n\f\v";
  auto first = str.find_first_not_of(kWhitespaces);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = str.find_last_not_of(kWhitespaces);
  return str.substr(first, last - first + 1);
}

std::vector<std::string_view> Split(std::string_view s, char delim,
                                    bool keep_empty) {
  std::vector<std::string_view> pieces;
  if (s.empty()) {
    return pieces;
  }
  std::size_t start = 0;
  while (true) {
    auto pos = s.find(delim, start);
    auto piece = s.substr(start, pos == std::string_view::npos
                                     ? std::string_view::npos
                                     : pos - start);
    if (keep_empty || !piece.empty()) {
      pieces.push_back(piece);
    }
    if (pos == std::string_view::npos) {
      break;
    }
    start = pos + 1;
  }
  return pieces;
}

bool IEquals(std::string_view first, std::string_view second) {
  if (first.size() != second.size()) {
    return false;
  }
  for (std::size_t i = 0; i != first.size(); ++i) {
    if (AsciiToLower(first[i]) != AsciiToLower(second[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace cirrus
