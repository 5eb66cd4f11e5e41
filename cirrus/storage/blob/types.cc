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

#include "cirrus/storage/blob/types.h"

#include <cctype>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

#include "cirrus/base/logging.h"

using namespace std::literals;

namespace cirrus {

std::string_view ToStringView(DeleteSnapshotsMethod method) noexcept {
  switch (method) {
    case DeleteSnapshotsMethod::Include:
      return "include"sv;
    case DeleteSnapshotsMethod::Only:
      return "only"sv;
  }
  CIRRUS_UNREACHABLE("Unexpected snapshot deletion method #{}.",
                     static_cast<int>(method));
}

std::optional<DeleteSnapshotsMethod>
TryParseTraits<DeleteSnapshotsMethod>::TryParse(std::string_view s) {
  if (IEquals(s, "include")) {
    return DeleteSnapshotsMethod::Include;
  } else if (IEquals(s, "only")) {
    return DeleteSnapshotsMethod::Only;
  }
  return std::nullopt;
}

std::optional<LeaseId> TryParseTraits<LeaseId>::TryParse(std::string_view s) {
  constexpr std::size_t kGroupSizes[] = {8, 4, 4, 4, 12};

  auto groups = Split(s, '-', true);
  if (groups.size() != std::size(kGroupSizes)) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i != groups.size(); ++i) {
    if (groups[i].size() != kGroupSizes[i]) {
      return std::nullopt;
    }
    for (auto&& c : groups[i]) {
      if (!isxdigit(static_cast<unsigned char>(c))) {
        return std::nullopt;
      }
    }
  }
  return LeaseId(std::string(s));
}

}  // namespace cirrus
