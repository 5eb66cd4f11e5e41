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

#include "cirrus/net/http/http_headers.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "cirrus/base/string.h"

namespace cirrus {

std::optional<std::string_view> HttpHeaders::TryGet(
    std::string_view key) const noexcept {
  for (auto&& [k, v] : fields_) {
    if (IEquals(k, key)) {
      return v;
    }
  }
  return std::nullopt;
}

void HttpHeaders::Append(std::string key, std::string value) {
  fields_.emplace_back(std::move(key), std::move(value));
}

}  // namespace cirrus
