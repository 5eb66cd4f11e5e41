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

#ifndef CIRRUS_STORAGE_BLOB_TYPES_H_
#define CIRRUS_STORAGE_BLOB_TYPES_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "cirrus/base/string.h"

namespace cirrus {

// What to do with snapshots of the blob being deleted.
//
// There's no "exclude": Deleting a blob with snapshots without specifying
// either of these is rejected by the service.
enum class DeleteSnapshotsMethod {
  Include,  // Delete the blob together with all of its snapshots.
  Only      // Delete the snapshots only, the blob itself is kept.
};

// `include` / `only`, as is sent on the wire.
std::string_view ToStringView(DeleteSnapshotsMethod method) noexcept;

// Identifies an active lease on a blob. Lease IDs are GUIDs, e.g.
// `f81d4fae-7dec-11d0-a765-00a0c91e6bf6`.
//
// Use `TryParse<LeaseId>(...)` to create one.
class LeaseId {
 public:
  const std::string& ToString() const noexcept { return id_; }

 private:
  friend struct TryParseTraits<LeaseId>;
  explicit LeaseId(std::string id) : id_(std::move(id)) {}

 private:
  std::string id_;
};

inline bool operator==(const LeaseId& left, const LeaseId& right) noexcept {
  return left.ToString() == right.ToString();
}

inline bool operator!=(const LeaseId& left, const LeaseId& right) noexcept {
  return !(left == right);
}

template <>
struct TryParseTraits<DeleteSnapshotsMethod> {
  // Case-insensitive.
  static std::optional<DeleteSnapshotsMethod> TryParse(std::string_view s);
};

template <>
struct TryParseTraits<LeaseId> {
  // Accepts GUIDs in `8-4-4-4-12` hexadecimal form only.
  static std::optional<LeaseId> TryParse(std::string_view s);
};

namespace blob {

// Header fields used by the blob service.
inline constexpr std::string_view kVersionHeader = "x-ms-version";
inline constexpr std::string_view kDateHeader = "x-ms-date";
inline constexpr std::string_view kRequestIdHeader = "x-ms-request-id";
inline constexpr std::string_view kClientRequestIdHeader =
    "x-ms-client-request-id";
inline constexpr std::string_view kLeaseIdHeader = "x-ms-lease-id";
inline constexpr std::string_view kDeleteSnapshotsHeader =
    "x-ms-delete-snapshots";
inline constexpr std::string_view kErrorCodeHeader = "x-ms-error-code";

}  // namespace blob

}  // namespace cirrus

#endif  // CIRRUS_STORAGE_BLOB_TYPES_H_
