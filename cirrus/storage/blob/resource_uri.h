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

#ifndef CIRRUS_STORAGE_BLOB_RESOURCE_URI_H_
#define CIRRUS_STORAGE_BLOB_RESOURCE_URI_H_

#include <string>
#include <string_view>

namespace cirrus::blob {

// Generates URI of a blob: `<service_root>/<container>/<blob>`.
//
// `container` and each `/`-separated segment of `blob` are percent-encoded,
// `/` in `blob` is kept as is (the service treats it as a virtual directory
// delimiter.).
//
// `service_root` is used verbatim and must not end with `/`.
std::string GenerateBlobUri(std::string_view service_root,
                            std::string_view container, std::string_view blob);

}  // namespace cirrus::blob

#endif  // CIRRUS_STORAGE_BLOB_RESOURCE_URI_H_
