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

#include "cirrus/base/encoding/percent.h"

#include "gtest/gtest.h"

namespace cirrus {

TEST(Percent, Unreserved) {
  EXPECT_EQ("AZaz09-._~", EncodePercent("AZaz09-._~"));
}

TEST(Percent, Reserved) {
  EXPECT_EQ("a%2Fb%3Fc%3Dd%26e", EncodePercent("a/b?c=d&e"));
  EXPECT_EQ("%3A%40%21%24%27%28%29%2A%2B%2C%3B%5B%5D%23",
            EncodePercent(":@!$'()*+,;[]#"));
}

TEST(Percent, Others) {
  EXPECT_EQ("my%20blob%25.txt", EncodePercent("my blob%.txt"));
  EXPECT_EQ("%E4%BD%A0%E5%A5%BD", EncodePercent("\xe4\xbd\xa0\xe5\xa5\xbd"));
  EXPECT_EQ("%00", EncodePercent(std::string_view("\0", 1)));
}

}  // namespace cirrus
