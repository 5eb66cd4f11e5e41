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

#ifndef CIRRUS_BASE_ENCODING_PERCENT_H_
#define CIRRUS_BASE_ENCODING_PERCENT_H_

#include <string>
#include <string_view>

namespace cirrus {

// Percent-encodes everything except RFC 3986 unreserved characters
// (alphanumerics and `-._~`), so the result is safe as a single URI path
// segment.
std::string EncodePercent(std::string_view from);

}  // namespace cirrus

#endif  // CIRRUS_BASE_ENCODING_PERCENT_H_
