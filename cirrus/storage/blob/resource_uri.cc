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

#include "cirrus/storage/blob/resource_uri.h"

#include <string>
#include <string_view>

#include "cirrus/base/encoding/percent.h"
#include "cirrus/base/string.h"

namespace cirrus::blob {

std::string GenerateBlobUri(std::string_view service_root,
                            std::string_view container, std::string_view blob) {
  std::string result(service_root);
  result += '/';
  result += EncodePercent(container);
  result += '/';

  bool first = true;
  for (auto&& segment : Split(blob, '/', true)) {
    if (!first) {
      result += '/';
    }
    first = false;
    result += EncodePercent(segment);
  }
  return result;
}

}  // namespace cirrus::blob
