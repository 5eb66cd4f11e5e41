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

#include "cirrus/base/status.h"

#include "gtest/gtest.h"

namespace cirrus {

TEST(Status, Success) {
  Status st;
  ASSERT_TRUE(st.ok());
  ASSERT_EQ(0, st.code());
  ASSERT_EQ("", st.message());
  Status copy = st;
  ASSERT_TRUE(copy.ok());
  ASSERT_EQ(st, copy);
}

TEST(Status, Failure) {
  Status st(7, "couldn't connect to server");
  ASSERT_FALSE(st.ok());
  ASSERT_EQ(7, st.code());
  ASSERT_EQ("couldn't connect to server", st.message());
  Status copy = st;
  ASSERT_FALSE(copy.ok());
  ASSERT_EQ(7, copy.code());
  ASSERT_EQ("couldn't connect to server", copy.message());
  ASSERT_EQ(st, copy);
  ASSERT_NE(st, Status(7, "timed out"));
}

TEST(Status, SuccessCarriesNoDescription) {
  Status st(0, "ignored");
  EXPECT_TRUE(st.ok());
  EXPECT_EQ("", st.message());
  EXPECT_EQ(Status(), st);
}

TEST(Status, ToString) {
  EXPECT_EQ("[0] The operation completed successfully.", Status().ToString());
  EXPECT_EQ("[28] Timeout was reached",
            Status(28, "Timeout was reached").ToString());
}

}  // namespace cirrus
