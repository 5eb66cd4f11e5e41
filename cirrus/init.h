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

#ifndef CIRRUS_INIT_H_
#define CIRRUS_INIT_H_

#include <functional>

namespace cirrus {

// Initialize cirrus runtime, call user's callback, and tear the runtime down.
//
// `argc` / `argv` passed to `cb` might be different from what's given to
// `Start`, as gflags consumes flags it recognizes. If the original one is
// needed, you need to capture them yourself.
//
// Return value of `cb` is returned as is.
int Start(int argc, char** argv, std::function<int(int, char**)> cb);

}  // namespace cirrus

#endif  // CIRRUS_INIT_H_
