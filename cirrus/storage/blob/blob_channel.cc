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

#include "cirrus/storage/blob/blob_channel.h"

#include <chrono>
#include <utility>

#include "cirrus/base/logging.h"
#include "cirrus/net/internal/http_engine.h"
#include "cirrus/net/internal/http_task.h"

namespace cirrus::blob {

void BlobChannel::Perform(
    const Channel* self, const BlobTask& task, std::chrono::nanoseconds timeout,
    std::function<void(Expected<BlobTaskCompletion, Status>)>* done) {
  auto cb = [done = std::move(*done)](
                Expected<internal::HttpTaskCompletion, Status> completion) {
    if (!completion) {
      CIRRUS_VLOG(1, "Failed to perform request to blob service: {}",
                  completion.error().ToString());
      done(std::move(completion).error());
      return;
    }
    done(BlobTaskCompletion(std::move(*completion)));
  };
  auto http_task = task.BuildTask();
  http_task.SetTimeout(timeout);
  internal::HttpEngine::Instance()->StartTask(std::move(http_task),
                                              std::move(cb));
}

}  // namespace cirrus::blob
