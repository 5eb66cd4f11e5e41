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

#ifndef CIRRUS_TESTING_MAIN_H_
#define CIRRUS_TESTING_MAIN_H_

namespace cirrus::testing {

// Do a full initialization and run all tests.
int InitAndRunAllTests(int* argc, char** argv);

// If you need to do some initialization yourself before running UTs, call
// `InitAndRunAllTests(...)` (see above) yourself.
#define CIRRUS_TEST_MAIN                                       \
  int main(int argc, char** argv) {                            \
    return ::cirrus::testing::InitAndRunAllTests(&argc, argv); \
  }

}  // namespace cirrus::testing

#endif  // CIRRUS_TESTING_MAIN_H_
