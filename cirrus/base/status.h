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

#ifndef CIRRUS_BASE_STATUS_H_
#define CIRRUS_BASE_STATUS_H_

#include <memory>
#include <string>

namespace cirrus {

// Outcome of a low-level operation, e.g. a `CURLcode` and libcurl's description
// of it for HTTP transfers.
//
// `0` is success and carries no description.
class Status {
 public:
  Status() noexcept = default;
  explicit Status(int code, const std::string& desc = {});

  bool ok() const noexcept { return !state_; }
  int code() const noexcept { return !state_ ? 0 : state_->code; }
  const std::string& message() const noexcept;

  // `[code] message`.
  std::string ToString() const;

 private:
  struct State {
    int code;
    std::string desc;
  };
  // Null for success. Shared since `Status` is copied into every error that
  // wraps it.
  std::shared_ptr<const State> state_;
};

bool operator==(const Status& left, const Status& right) noexcept;
inline bool operator!=(const Status& left, const Status& right) noexcept {
  return !(left == right);
}

}  // namespace cirrus

#endif  // CIRRUS_BASE_STATUS_H_
