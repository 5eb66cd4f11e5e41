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

#ifndef CIRRUS_STORAGE_BLOB_BLOB_CHANNEL_H_
#define CIRRUS_STORAGE_BLOB_BLOB_CHANNEL_H_

#include "cirrus/storage/blob/channel.h"

namespace cirrus::blob {

// This channel interacts with our HTTP engine.
class BlobChannel : public Channel {
 public:
  void Perform(const Channel* self, const BlobTask& task,
               std::chrono::nanoseconds timeout,
               std::function<void(Expected<BlobTaskCompletion, Status>)>* done)
      override;
};

}  // namespace cirrus::blob

#endif  // CIRRUS_STORAGE_BLOB_BLOB_CHANNEL_H_
