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

#ifndef CIRRUS_NET_HTTP_HTTP_HEADERS_H_
#define CIRRUS_NET_HTTP_HTTP_HEADERS_H_

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cirrus {

// Header fields of a response from the blob service, in the order received.
//
// Field names are compared case-insensitively (RFC 7230, section 3.2). A name
// may repeat, so fields are kept in a list rather than a map.
class HttpHeaders {
  using Fields = std::vector<std::pair<std::string, std::string>>;

 public:
  using const_iterator = Fields::const_iterator;

  const_iterator begin() const noexcept { return fields_.begin(); }
  const_iterator end() const noexcept { return fields_.end(); }

  std::size_t size() const noexcept { return fields_.size(); }
  bool empty() const noexcept { return fields_.empty(); }

  // Value of the first field named `key`, `std::nullopt` if there's none.
  std::optional<std::string_view> TryGet(std::string_view key) const noexcept;

  void Append(std::string key, std::string value);

 private:
  Fields fields_;
};

}  // namespace cirrus

#endif  // CIRRUS_NET_HTTP_HTTP_HEADERS_H_
