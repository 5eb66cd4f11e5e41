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

#include "cirrus/storage/blob/blob_client.h"

#include <string>
#include <string_view>
#include <utility>

#include "gflags/gflags.h"

#include "cirrus/base/logging.h"
#include "cirrus/base/string.h"
#include "cirrus/storage/blob/blob_channel.h"

using namespace std::literals;

DEFINE_int32(cirrus_blob_client_default_timeout_ms, 10000,
             "Default timeout for blob client.");
DEFINE_string(cirrus_blob_api_version, "2019-12-12",
              "Default value of `x-ms-version` sent by blob client.");

namespace cirrus {

namespace {

blob::Channel* mock_channel;

}  // namespace

bool BlobClient::Open(const std::string& uri) { return Open(uri, Options()); }

bool BlobClient::Open(const std::string& uri, const Options& options) {
  constexpr auto kDelimiter = "://"sv;
  auto uri_view = std::string_view(uri);
  auto delim_pos = uri_view.find(kDelimiter);
  if (delim_pos == std::string_view::npos) {
    CIRRUS_LOG_WARNING("Invalid blob service URI: [{}].", uri_view);
    return false;
  }
  auto scheme = uri_view.substr(0, delim_pos);
  auto rest = uri_view.substr(delim_pos + kDelimiter.size());

  options_ = options;
  task_opts_.api_version = options_.api_version;
  owning_channel_ = nullptr;
  channel_ = nullptr;

  if (scheme == "azblob" || scheme == "mock") {
    // The `rest` is account name.
    account_ = options_.account.empty() ? std::string(rest) : options_.account;
    if (account_.empty() || account_.find('/') != std::string::npos) {
      CIRRUS_LOG_WARNING("Invalid storage account in URI [{}].", uri_view);
      return false;
    }
    service_root_ =
        Format("https://{}.blob.{}", account_, options_.endpoint_suffix);
    if (scheme == "azblob") {
      owning_channel_ = std::make_unique<blob::BlobChannel>();
      channel_ = owning_channel_.get();
    } else {
      CIRRUS_CHECK(mock_channel,
                   "Blob mock channel is not registered. Have you forgotten to "
                   "link against `cirrus_testing`?");
      channel_ = mock_channel;
    }
  } else if (scheme == "http" || scheme == "https") {
    // Path-style: `rest` is `host[:port]/account`.
    while (EndsWith(rest, "/")) {
      rest.remove_suffix(1);
    }
    auto slash = rest.find('/');
    if (slash == std::string_view::npos || slash == 0 ||
        slash + 1 == rest.size()) {
      CIRRUS_LOG_WARNING(
          "Invalid blob service URI [{}], expecting "
          "`http(s)://host[:port]/account`.",
          uri_view);
      return false;
    }
    account_ = std::string(rest.substr(slash + 1));
    service_root_ = Format("{}://{}", scheme, rest);
    owning_channel_ = std::make_unique<blob::BlobChannel>();
    channel_ = owning_channel_.get();
  } else {
    CIRRUS_LOG_WARNING("Unexpected blob service URI scheme [{}].", scheme);
    return false;
  }
  return true;
}

DeleteBlobBuilder<blob::No, blob::No, blob::No> BlobClient::DeleteBlob()
    const {
  return DeleteBlobBuilder<blob::No, blob::No, blob::No>(this);
}

Future<Expected<blob::BlobTaskCompletion, BlobError>>
BlobClient::PerformRequest(
    const std::string& uri, HttpMethod method,
    const std::function<void(blob::BlobTask*)>& header_mutator,
    std::string body, std::chrono::nanoseconds timeout) const {
  if (!channel_) {
    return BlobError::NotOpened();
  }

  blob::BlobTask task(&task_opts_);
  task.set_method(method);
  task.set_uri(uri);
  task.set_body(std::move(body));
  if (header_mutator) {
    header_mutator(&task);
  }

  Promise<Expected<blob::BlobTaskCompletion, BlobError>> promise;
  auto future = promise.GetFuture();
  std::function<void(Expected<blob::BlobTaskCompletion, Status>)> done =
      [promise](Expected<blob::BlobTaskCompletion, Status> completion) mutable {
        if (!completion) {
          promise.SetValue(
              BlobError::TransportError(std::move(completion).error()));
        } else {
          promise.SetValue(std::move(*completion));
        }
      };
  channel_->Perform(channel_, task,
                    timeout.count() ? timeout : options_.timeout, &done);
  return future;
}

void BlobClient::RegisterMockChannel(blob::Channel* channel) {
  mock_channel = channel;
}

}  // namespace cirrus
