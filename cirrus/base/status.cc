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

#include "cirrus/base/status.h"

#include <memory>
#include <string>

#include "cirrus/base/logging.h"
#include "cirrus/base/string.h"

namespace cirrus {

Status::Status(int code, const std::string& desc) {
  if (code != 0) {
    state_ = std::make_shared<const State>(State{code, desc});
    return;
  }
  CIRRUS_LOG_ERROR_IF(!desc.empty(),
                      "Description [{}] is dropped from a successful status.",
                      desc);
}

const std::string& Status::message() const noexcept {
  static const std::string kNoDescription;
  return !state_ ? kNoDescription : state_->desc;
}

std::string Status::ToString() const {
  return Format("[{}] {}", code(),
                !ok() ? message() : "The operation completed successfully.");
}

bool operator==(const Status& left, const Status& right) noexcept {
  return left.code() == right.code() && left.message() == right.message();
}

}  // namespace cirrus
