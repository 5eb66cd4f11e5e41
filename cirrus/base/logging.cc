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

#include "cirrus/base/logging.h"

#include <string>
#include <vector>

namespace cirrus::internal::logging::details {

std::string DescribeFormatArguments(const std::vector<std::string>& args) {
  std::string result;
  for (auto&& e : args) {
    if (!result.empty()) {
      result += ", ";
    }
    result += "[" + e + "]";
  }
  return result;
}

}  // namespace cirrus::internal::logging::details
