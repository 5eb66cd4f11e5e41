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

#ifndef CIRRUS_NET_INTERNAL_HTTP_ENGINE_H_
#define CIRRUS_NET_INTERNAL_HTTP_ENGINE_H_

#include <functional>

#include "cirrus/base/expected.h"
#include "cirrus/base/status.h"
#include "cirrus/net/internal/http_task.h"

namespace cirrus::internal {

// Performs `HttpTask`s asynchronously, using libcurl's multi interface.
//
// Tasks are performed by a dedicated background thread, `done` is called in
// that thread as well. On failure, `done` is called with a `Status` whose
// code is the `CURLcode` reported by libcurl.
class HttpEngine {
 public:
  static HttpEngine* Instance();

  void StartTask(
      HttpTask task,
      std::function<void(Expected<HttpTaskCompletion, Status>)> done);

  // This is called by `cirrus::Start()` on exit and may not be called by
  // users. Tasks still in flight are failed with `CURLE_ABORTED_BY_CALLBACK`.
  static void Stop();
  static void Join();

 private:
  HttpEngine();
};

}  // namespace cirrus::internal

#endif  // CIRRUS_NET_INTERNAL_HTTP_ENGINE_H_
