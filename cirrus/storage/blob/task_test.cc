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

#include "cirrus/storage/blob/task.h"

#include "gtest/gtest.h"

namespace cirrus::blob {

TEST(BlobTask, Accessors) {
  BlobTask::Options opts;
  opts.api_version = "2019-12-12";
  BlobTask task(&opts);
  task.set_method(HttpMethod::Delete);
  task.set_uri("https://account.blob.core.windows.net/container/blob");
  task.AddHeader("x-ms-delete-snapshots", "include");
  task.AddHeader("x-ms-lease-id", "f81d4fae-7dec-11d0-a765-00a0c91e6bf6");

  EXPECT_EQ("2019-12-12", task.options().api_version);
  EXPECT_EQ(HttpMethod::Delete, task.method());
  EXPECT_EQ("https://account.blob.core.windows.net/container/blob",
            task.uri());
  ASSERT_EQ(2, task.headers().size());
  EXPECT_EQ("x-ms-delete-snapshots: include", task.headers()[0]);
  EXPECT_EQ("x-ms-lease-id: f81d4fae-7dec-11d0-a765-00a0c91e6bf6",
            task.headers()[1]);
  EXPECT_TRUE(task.body().empty());

  // Doesn't crash.
  [[maybe_unused]] auto http_task = task.BuildTask();
}

TEST(BlobTaskCompletion, Headers) {
  BlobTaskCompletion completion(
      HttpStatus::Accepted,
      {"x-ms-request-id: abc", "x-ms-version:2019-12-12 ", "malformed",
       "Date: Sun, 06 Nov 1994 08:49:37 GMT"},
      "");
  EXPECT_EQ(HttpStatus::Accepted, completion.status());
  ASSERT_EQ(3, completion.headers()->size());
  EXPECT_EQ("abc", completion.headers()->TryGet("X-MS-REQUEST-ID"));
  EXPECT_EQ("2019-12-12", completion.headers()->TryGet("x-ms-version"));
  EXPECT_EQ("Sun, 06 Nov 1994 08:49:37 GMT",
            completion.headers()->TryGet("date"));
  EXPECT_TRUE(completion.body()->empty());
}

}  // namespace cirrus::blob
