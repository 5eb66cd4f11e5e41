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

#ifndef CIRRUS_STORAGE_BLOB_BLOB_CLIENT_H_
#define CIRRUS_STORAGE_BLOB_BLOB_CLIENT_H_

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "gflags/gflags_declare.h"

#include "cirrus/base/expected.h"
#include "cirrus/base/future.h"
#include "cirrus/net/http/types.h"
#include "cirrus/storage/blob/blob_error.h"
#include "cirrus/storage/blob/channel.h"
#include "cirrus/storage/blob/ops/delete_blob.h"
#include "cirrus/storage/blob/task.h"

DECLARE_int32(cirrus_blob_client_default_timeout_ms);
DECLARE_string(cirrus_blob_api_version);

namespace cirrus {

// This class helps you interacting with Azure Blob Storage.
//
// Requests are not signed. Either the container allows anonymous access, or
// a SAS is not required by whatever sits in front of the service (e.g., the
// storage emulator).
class BlobClient {
 public:
  struct Options {
    // Storage account name. If set, it takes precedence over the account
    // given in URI (`azblob://` and `mock://` only).
    std::string account;

    // Used for building service root for `azblob://` URIs.
    std::string endpoint_suffix = "core.windows.net";

    // Sent as `x-ms-version`.
    std::string api_version = FLAGS_cirrus_blob_api_version;

    // Effective only if no timeout is set explicitly when performing request.
    std::chrono::nanoseconds timeout =
        std::chrono::milliseconds(FLAGS_cirrus_blob_client_default_timeout_ms);
  };

  // Initialize this client.
  //
  // Acceptable `uri`:
  //
  // - azblob://myaccount: Using `https://myaccount.blob.core.windows.net`.
  // - http(s)://host[:port]/myaccount: Path-style service root, e.g. the
  //   storage emulator at `http://127.0.0.1:10000/devstoreaccount1`.
  // - mock://myaccount: Mostly used in UT, for mocking blob service. You need
  //   to link against `cirrus_testing` for this to work.
  //
  // `false` is returned if `uri` is not acceptable.
  bool Open(const std::string& uri);
  bool Open(const std::string& uri, const Options& options);

  // Starts building a Delete Blob request.
  //
  // @sa: `cirrus/storage/blob/ops/delete_blob.h`
  DeleteBlobBuilder<blob::No, blob::No, blob::No> DeleteBlob() const;

  // e.g. `https://myaccount.blob.core.windows.net`. Without trailing slash.
  const std::string& service_root() const noexcept { return service_root_; }
  const std::string& account() const noexcept { return account_; }
  const Options& options() const noexcept { return options_; }

  // Sends a request to blob service.
  //
  // `header_mutator` is called (synchronously) for adding
  // operation-specific headers. Headers required by every request are added
  // by us.
  //
  // The future is satisfied with whatever the service responded, no matter
  // what its status code is. `BlobStatus::TransportError` is reported if no
  // response was received.
  Future<Expected<blob::BlobTaskCompletion, BlobError>> PerformRequest(
      const std::string& uri, HttpMethod method,
      const std::function<void(blob::BlobTask*)>& header_mutator,
      std::string body, std::chrono::nanoseconds timeout = {}) const;

  // FOR INTERNAL USE ONLY.
  static void RegisterMockChannel(blob::Channel* channel);

 private:
  Options options_;
  blob::BlobTask::Options task_opts_;
  std::string account_;
  std::string service_root_;
  std::unique_ptr<blob::Channel> owning_channel_;
  blob::Channel* channel_ = nullptr;
};

}  // namespace cirrus

#endif  // CIRRUS_STORAGE_BLOB_BLOB_CLIENT_H_
