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

#include "cirrus/net/http/date.h"

#include <chrono>

#include "gtest/gtest.h"

using namespace std::literals;

namespace cirrus {

TEST(Date, Format) {
  EXPECT_EQ("Thu, 01 Jan 1970 00:00:00 GMT",
            FormatHttpDate(std::chrono::system_clock::time_point()));
  EXPECT_EQ("Sun, 06 Nov 1994 08:49:37 GMT",
            FormatHttpDate(std::chrono::system_clock::from_time_t(784111777)));
}

TEST(Date, Parse) {
  auto parsed = TryParseHttpDate("Sun, 06 Nov 1994 08:49:37 GMT");
  ASSERT_TRUE(parsed);
  EXPECT_EQ(std::chrono::system_clock::from_time_t(784111777), *parsed);

  auto now = std::chrono::system_clock::from_time_t(
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
  EXPECT_EQ(now, TryParseHttpDate(FormatHttpDate(now)));
}

TEST(Date, Malformed) {
  EXPECT_FALSE(TryParseHttpDate(""));
  EXPECT_FALSE(TryParseHttpDate("yesterday"));
  EXPECT_FALSE(TryParseHttpDate("Sun, 06 Nov 1994 08:49:37"));
  EXPECT_FALSE(TryParseHttpDate("Sun, 06 Nov 1994 08:49:37 GMT trailing"));
  EXPECT_FALSE(TryParseHttpDate("1994-11-06T08:49:37Z"));
}

}  // namespace cirrus
