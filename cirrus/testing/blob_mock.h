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

#ifndef CIRRUS_TESTING_BLOB_MOCK_H_
#define CIRRUS_TESTING_BLOB_MOCK_H_

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"

#include "cirrus/base/expected.h"
#include "cirrus/base/status.h"
#include "cirrus/net/http/types.h"
#include "cirrus/storage/blob/channel.h"
#include "cirrus/storage/blob/task.h"

// Usage: `CIRRUS_EXPECT_BLOB_REQUEST()...`
//
// Requests sent by `BlobClient`s opened with `mock://...` are intercepted.
//
// Currently the following actions are supported:
//
// - `cirrus::testing::RespondWith(status, headers, body)`: Complete the request
//   with the given response. `headers` are in the form of `Name: value`.
//
// - `cirrus::testing::FailWith(status)`: Fail the request as if the transport
//   failed with `status`.
//
// - `cirrus::testing::HandleBlobRequest(F&& handler)`: Handle the request
//   yourself. The handler is expected to have a signature as:
//
//   ```cpp
//   cirrus::Expected<cirrus::blob::BlobTaskCompletion, cirrus::Status>
//   Handler(const cirrus::blob::BlobTask& task);
//   ```
//
// The request itself can be matched by `.With(...)` on the second argument
// (`const blob::BlobTask&`).
#define CIRRUS_EXPECT_BLOB_REQUEST()                                      \
  ::testing::Mock::AllowLeak(                                             \
      ::cirrus::testing::detail::GetMockBlobChannel());                   \
  EXPECT_CALL(*::cirrus::testing::detail::GetMockBlobChannel(),           \
              Perform(::testing::_ /* self, ignored */, ::testing::_,     \
                      ::testing::_ /* timeout, ignored */,                \
                      ::testing::_ /* done, ignored */))

namespace cirrus::testing {

namespace detail {

using BlobDoneCallback =
    std::function<void(Expected<blob::BlobTaskCompletion, Status>)>;

class MockBlobChannel : public blob::Channel {
 public:
  MOCK_METHOD4(Perform,
               void(const blob::Channel*, const blob::BlobTask& task,
                    std::chrono::nanoseconds timeout, BlobDoneCallback* done));
};

// Registered to `BlobClient` on program startup.
MockBlobChannel* GetMockBlobChannel();

}  // namespace detail

template <class F>
auto HandleBlobRequest(F&& handler) {
  return [h = std::forward<F>(handler)](const blob::Channel*,
                                        const blob::BlobTask& task,
                                        std::chrono::nanoseconds,
                                        detail::BlobDoneCallback* done) {
    (*done)(h(task));
  };
}

inline auto RespondWith(HttpStatus status,
                        std::vector<std::string> headers = {},
                        std::string body = {}) {
  return HandleBlobRequest(
      [status, headers = std::move(headers), body = std::move(body)](
          const blob::BlobTask&) -> Expected<blob::BlobTaskCompletion, Status> {
        return blob::BlobTaskCompletion(status, headers, body);
      });
}

inline auto FailWith(Status status) {
  return HandleBlobRequest(
      [status = std::move(status)](
          const blob::BlobTask&) -> Expected<blob::BlobTaskCompletion, Status> {
        return status;
      });
}

}  // namespace cirrus::testing

#endif  // CIRRUS_TESTING_BLOB_MOCK_H_
