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

#include <string>

#include "gflags/gflags.h"
#include "glog/logging.h"

#include "cirrus/base/logging.h"
#include "cirrus/base/string.h"
#include "cirrus/init.h"
#include "cirrus/storage/blob/blob_client.h"
#include "cirrus/storage/blob/ops/delete_blob.h"

DEFINE_string(uri, "", "e.g. `azblob://myaccount`.");
DEFINE_string(container, "", "");
DEFINE_string(blob, "", "");
DEFINE_string(delete_snapshots, "", "Either `include` or `only`.");
DEFINE_uint64(timeout, 0, "Server side timeout in seconds. 0 for none.");
DEFINE_string(lease_id, "", "");
DEFINE_string(client_request_id, "", "");

namespace example {

int Entry(int argc, char** argv) {
  cirrus::BlobClient client;
  if (!client.Open(FLAGS_uri)) {
    CIRRUS_LOG_ERROR("Failed to open [{}].", FLAGS_uri);
    return 1;
  }

  // Flags left empty are left unset, so that missing ones are reported by
  // `DeleteBlob` itself.
  cirrus::DeleteBlobParameters params;
  if (!FLAGS_container.empty()) {
    params.set_container_name(FLAGS_container);
  }
  if (!FLAGS_blob.empty()) {
    params.set_blob_name(FLAGS_blob);
  }
  if (!FLAGS_delete_snapshots.empty()) {
    auto method =
        cirrus::TryParse<cirrus::DeleteSnapshotsMethod>(FLAGS_delete_snapshots);
    if (!method) {
      CIRRUS_LOG_ERROR("Unrecognized snapshot deletion method [{}].",
                       FLAGS_delete_snapshots);
      return 1;
    }
    params.set_delete_snapshots_method(*method);
  }
  if (FLAGS_timeout) {
    params.set_timeout(FLAGS_timeout);
  }
  if (!FLAGS_lease_id.empty()) {
    auto lease_id = cirrus::TryParse<cirrus::LeaseId>(FLAGS_lease_id);
    if (!lease_id) {
      CIRRUS_LOG_ERROR("Malformed lease ID [{}].", FLAGS_lease_id);
      return 1;
    }
    params.set_lease_id(*lease_id);
  }
  if (!FLAGS_client_request_id.empty()) {
    params.set_client_request_id(FLAGS_client_request_id);
  }

  auto result = cirrus::DeleteBlob(client, params);
  if (!result) {
    CIRRUS_LOG_WARNING("Failed to delete [{}/{}]: {}", FLAGS_container,
                       FLAGS_blob, result.error().ToString());
    return 1;
  }
  CIRRUS_LOG_INFO("Deleted [{}/{}], request ID [{}].", FLAGS_container,
                  FLAGS_blob, result->request_id);
  return 0;
}

}  // namespace example

int main(int argc, char** argv) {
  FLAGS_logtostderr = true;
  return cirrus::Start(argc, argv, example::Entry);
}
