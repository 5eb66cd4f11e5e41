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

#include "cirrus/init.h"

#include <csignal>
#include <functional>

#include "gflags/gflags.h"
#include "glog/logging.h"

#include "cirrus/base/logging.h"
#include "cirrus/net/internal/http_engine.h"

namespace cirrus {

int Start(int argc, char** argv, std::function<int(int, char**)> cb) {
  google::InstallFailureSignalHandler();
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  // This is a bit late, but we cannot write log (into file) before glog is
  // initialized.
  CIRRUS_LOG_INFO("Cirrus started.");

  CIRRUS_CHECK(signal(SIGPIPE, SIG_IGN) != SIG_ERR);

  int rc = cb(argc, argv);  // User's callback.

  internal::HttpEngine::Stop();
  internal::HttpEngine::Join();

  CIRRUS_LOG_INFO("Exited");
  return rc;
}

}  // namespace cirrus
