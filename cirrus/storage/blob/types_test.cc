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

#include "cirrus/storage/blob/types.h"

#include "gtest/gtest.h"

namespace cirrus {

TEST(DeleteSnapshotsMethod, ToStringView) {
  EXPECT_EQ("include", ToStringView(DeleteSnapshotsMethod::Include));
  EXPECT_EQ("only", ToStringView(DeleteSnapshotsMethod::Only));
}

TEST(DeleteSnapshotsMethod, TryParse) {
  EXPECT_EQ(DeleteSnapshotsMethod::Include,
            TryParse<DeleteSnapshotsMethod>("include"));
  EXPECT_EQ(DeleteSnapshotsMethod::Only,
            TryParse<DeleteSnapshotsMethod>("ONLY"));
  EXPECT_FALSE(TryParse<DeleteSnapshotsMethod>("exclude"));
  EXPECT_FALSE(TryParse<DeleteSnapshotsMethod>(""));
}

TEST(LeaseId, TryParse) {
  auto id = TryParse<LeaseId>("f81d4fae-7dec-11d0-a765-00a0c91e6bf6");
  ASSERT_TRUE(id);
  EXPECT_EQ("f81d4fae-7dec-11d0-a765-00a0c91e6bf6", id->ToString());
  EXPECT_EQ(id, TryParse<LeaseId>("f81d4fae-7dec-11d0-a765-00a0c91e6bf6"));
  EXPECT_NE(id, TryParse<LeaseId>("F81D4FAE-7DEC-11D0-A765-00A0C91E6BF6"));

  EXPECT_FALSE(TryParse<LeaseId>(""));
  EXPECT_FALSE(TryParse<LeaseId>("f81d4fae7dec11d0a76500a0c91e6bf6"));
  EXPECT_FALSE(TryParse<LeaseId>("f81d4fae-7dec-11d0-a765-00a0c91e6bf"));
  EXPECT_FALSE(TryParse<LeaseId>("g81d4fae-7dec-11d0-a765-00a0c91e6bf6"));
  EXPECT_FALSE(TryParse<LeaseId>("f81d4fae-7dec-11d0-a765-00a0c91e6bf6-"));
}

}  // namespace cirrus
