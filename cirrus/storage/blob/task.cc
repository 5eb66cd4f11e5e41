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

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cirrus/base/logging.h"
#include "cirrus/base/string.h"
#include "cirrus/net/http/date.h"
#include "cirrus/storage/blob/types.h"

namespace cirrus::blob {

BlobTask::BlobTask(const Options* options) : options_(options) {}

void BlobTask::AddHeader(std::string_view name, std::string_view value) {
  headers_.emplace_back(Format("{}: {}", name, value));
}

internal::HttpTask BlobTask::BuildTask() const {
  internal::HttpTask task;

  // Suppress headers added by libcurl automatically. The service does not need
  // them, and `Expect: 100-continue` costs us a round-trip.
  task.AddHeader("Accept:");
  task.AddHeader("Content-Type:");
  task.AddHeader("Expect:");

  // Apply everything that have been applied on us.
  task.SetMethod(method_);
  task.SetUrl(uri_);
  task.AddHeader(Format("{}: {}", kVersionHeader, options_->api_version));
  task.AddHeader(Format("{}: {}", kDateHeader,
                        FormatHttpDate(std::chrono::system_clock::now())));
  task.AddHeader("Content-Length: " + std::to_string(body_.size()));
  if (!body_.empty()) {
    task.SetBody(body_);
  }
  for (auto&& e : headers_) {
    task.AddHeader(e);
  }
  return task;
}

BlobTaskCompletion::BlobTaskCompletion(internal::HttpTaskCompletion&& comp)
    : BlobTaskCompletion(comp.status(), std::move(*comp.headers()),
                         std::move(*comp.body())) {}

BlobTaskCompletion::BlobTaskCompletion(HttpStatus status,
                                       std::vector<std::string> headers,
                                       std::string body)
    : status_(status), body_(std::move(body)) {
  for (auto&& str : headers) {
    std::string_view e = str;
    auto pos = e.find_first_of(':');
    if (pos == std::string_view::npos) {
      CIRRUS_LOG_WARNING_EVERY_SECOND("Ignoring malformed header [{}].", e);
      continue;
    }
    headers_.Append(std::string(Trim(e.substr(0, pos))),
                    std::string(Trim(e.substr(pos + 1))));
  }
}

}  // namespace cirrus::blob
