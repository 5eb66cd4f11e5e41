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

#include "cirrus/testing/blob_mock.h"

#include "cirrus/storage/blob/blob_client.h"

namespace cirrus::testing::detail {

namespace {

MockBlobChannel* CreateAndRegisterMockChannel() {
  // Never destroyed, requests may still be in flight on exit.
  auto channel = new MockBlobChannel();
  BlobClient::RegisterMockChannel(channel);
  return channel;
}

// Make sure the channel is registered before `main` runs.
[[maybe_unused]] MockBlobChannel* const registered_channel =
    GetMockBlobChannel();

}  // namespace

MockBlobChannel* GetMockBlobChannel() {
  static MockBlobChannel* channel = CreateAndRegisterMockChannel();
  return channel;
}

}  // namespace cirrus::testing::detail
