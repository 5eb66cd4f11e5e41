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

#include "cirrus/base/future.h"

#include <memory>
#include <string>
#include <thread>

#include "gtest/gtest.h"

#include "cirrus/base/expected.h"

using namespace std::literals;

namespace cirrus {

TEST(Future, ReadyValue) {
  Future<int> future(42);
  EXPECT_EQ(42, BlockingGet(std::move(future)));
}

TEST(Future, ThenOnReadyFutureRunsInline) {
  bool called = false;
  auto future = Future<int>(1).Then([&](int x) {
    called = true;
    return std::to_string(x + 1);
  });
  EXPECT_TRUE(called);
  EXPECT_EQ("2", BlockingGet(std::move(future)));
}

TEST(Future, ThenBeforeSetValue) {
  Promise<std::string> promise;
  std::string seen;
  auto future = promise.GetFuture().Then([&](std::string s) {
    seen = s;
    return s.size();
  });
  EXPECT_TRUE(seen.empty());
  promise.SetValue("request-id");
  EXPECT_EQ("request-id", seen);
  EXPECT_EQ(10, BlockingGet(std::move(future)));
}

TEST(Future, MoveOnlyContinuation) {
  Promise<int> promise;
  auto captured = std::make_unique<int>(10);
  auto future = promise.GetFuture().Then(
      [p = std::move(captured)](int x) { return *p + x; });
  promise.SetValue(5);
  EXPECT_EQ(15, BlockingGet(std::move(future)));
}

TEST(Future, SatisfiedFromAnotherThread) {
  Promise<Expected<int, std::string>> promise;
  auto future = promise.GetFuture();
  std::thread t([promise]() mutable {
    std::this_thread::sleep_for(10ms);
    promise.SetValue(Expected<int, std::string>(202));
  });
  auto result = BlockingGet(std::move(future));
  t.join();
  ASSERT_TRUE(result);
  EXPECT_EQ(202, *result);
}

TEST(Future, ExpectedError) {
  Future<Expected<int, std::string>> future(std::string("transport failed"));
  auto result = BlockingGet(std::move(future));
  ASSERT_FALSE(result);
  EXPECT_EQ("transport failed", result.error());
}

}  // namespace cirrus
