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

#ifndef CIRRUS_STORAGE_BLOB_OPS_DELETE_BLOB_H_
#define CIRRUS_STORAGE_BLOB_OPS_DELETE_BLOB_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "cirrus/base/enum.h"
#include "cirrus/base/expected.h"
#include "cirrus/base/future.h"
#include "cirrus/net/http/http_headers.h"
#include "cirrus/storage/blob/blob_error.h"
#include "cirrus/storage/blob/types.h"

// This file implements blob service's Delete Blob operation.
//
// @sa: https://docs.microsoft.com/en-us/rest/api/storageservices/delete-blob
//
// Two ways are provided for performing the operation:
//
// - `DeleteBlobBuilder`: Parameters are supplied via `WithXxx` calls. Whether
//   each mandatory parameter has been supplied is tracked in the builder's
//   type, and `Finalize()` is only available once all of them are. Forgetting
//   one is therefore a compile-time error:
//
//   ```cpp
//   auto result = BlockingGet(client.DeleteBlob()
//                                 .WithContainerName("container")
//                                 .WithBlobName("dir/blob")
//                                 .WithDeleteSnapshotsMethod(
//                                     DeleteSnapshotsMethod::Include)
//                                 .Finalize());
//   ```
//
// - `DeleteBlobParameters` + `AsyncDeleteBlob` / `DeleteBlob`: For parameters
//   known only at runtime. Missing parameters are reported as
//   `BlobStatus::MissingParameter`, before anything is sent.

namespace cirrus {

class BlobClient;

namespace blob {

// Markers for whether a mandatory parameter has been supplied.
struct Yes {};
struct No {};

template <class T>
inline constexpr bool is_supplied_v = std::is_same_v<T, Yes>;

}  // namespace blob

// Mandatory parameters of Delete Blob.
enum class DeleteBlobField {
  None = 0,
  ContainerName = 1,
  BlobName = 2,
  DeleteSnapshotsMethod = 4,
  All = ContainerName | BlobName | DeleteSnapshotsMethod
};

CIRRUS_DEFINE_ENUM_BITMASK_OPS(DeleteBlobField)

// Parameters of Delete Blob.
class DeleteBlobParameters {
 public:
  void set_container_name(std::string name);
  void set_blob_name(std::string name);
  void set_delete_snapshots_method(DeleteSnapshotsMethod method);

  // Server side timeout, in seconds. This has nothing to do with how long we'd
  // wait for the response.
  void set_timeout(std::uint64_t seconds) { timeout_ = seconds; }
  // Required if the blob has an active lease.
  void set_lease_id(LeaseId lease_id) { lease_id_ = std::move(lease_id); }
  // Echoed back by the service, for correlating requests.
  void set_client_request_id(std::string id) {
    client_request_id_ = std::move(id);
  }

  // `BlobStatus::MissingParameter` is returned if not set.
  Expected<std::string, BlobError> container_name() const;
  Expected<std::string, BlobError> blob_name() const;
  Expected<DeleteSnapshotsMethod, BlobError> delete_snapshots_method() const;

  const std::optional<std::uint64_t>& timeout() const noexcept {
    return timeout_;
  }
  const std::optional<LeaseId>& lease_id() const noexcept { return lease_id_; }
  const std::optional<std::string>& client_request_id() const noexcept {
    return client_request_id_;
  }

  // Mandatory parameters supplied so far.
  DeleteBlobField supplied() const noexcept { return supplied_; }

  // Reports the first missing mandatory parameter, in the order of container
  // name, blob name, and snapshot deletion method.
  Expected<void, BlobError> Validate() const;

 private:
  friend bool operator==(const DeleteBlobParameters& left,
                         const DeleteBlobParameters& right);

  DeleteBlobField supplied_ = DeleteBlobField::None;
  std::string container_name_;
  std::string blob_name_;
  // Not sent unless explicitly supplied, as is the case for other mandatory
  // parameters.
  DeleteSnapshotsMethod delete_snapshots_method_ =
      DeleteSnapshotsMethod::Include;
  std::optional<std::uint64_t> timeout_;
  std::optional<LeaseId> lease_id_;
  std::optional<std::string> client_request_id_;
};

bool operator==(const DeleteBlobParameters& left,
                const DeleteBlobParameters& right);

inline bool operator!=(const DeleteBlobParameters& left,
                       const DeleteBlobParameters& right) {
  return !(left == right);
}

// Result of a successful Delete Blob. The service sends no body.
struct DeleteBlobResponse {
  // `x-ms-request-id`, always present.
  std::string request_id;

  // `x-ms-client-request-id`, present if one was sent.
  std::optional<std::string> client_request_id;

  // `x-ms-version` the service used for handling the request.
  std::optional<std::string> version;

  // `Date` of the response.
  std::optional<std::chrono::system_clock::time_point> date;

  // `BlobStatus::ResponseParseError` is returned if `x-ms-request-id` is
  // missing or `Date` is malformed.
  static Expected<DeleteBlobResponse, BlobError> FromHeaders(
      const HttpHeaders& headers);
};

// Deletes a blob. `params` is validated before anything is sent.
//
// `client` must outlive the returned future.
Future<Expected<DeleteBlobResponse, BlobError>> AsyncDeleteBlob(
    const BlobClient& client, DeleteBlobParameters params);

// Blocking version of `AsyncDeleteBlob`.
Expected<DeleteBlobResponse, BlobError> DeleteBlob(const BlobClient& client,
                                                   DeleteBlobParameters params);

// Builds Delete Blob request. Usually you get one via `BlobClient::DeleteBlob`.
//
// Each `WithXxx` returns a new builder, leaving this one untouched.
template <class ContainerNameSet, class BlobNameSet,
          class DeleteSnapshotsMethodSet>
class DeleteBlobBuilder {
 public:
  template <class C = ContainerNameSet, class B = BlobNameSet,
            class D = DeleteSnapshotsMethodSet,
            class = std::enable_if_t<std::is_same_v<C, blob::No> &&
                                     std::is_same_v<B, blob::No> &&
                                     std::is_same_v<D, blob::No>>>
  explicit DeleteBlobBuilder(const BlobClient* client) : client_(client) {}

  // Mandatory parameters.
  auto WithContainerName(std::string name) const {
    auto params = params_;
    params.set_container_name(std::move(name));
    return DeleteBlobBuilder<blob::Yes, BlobNameSet, DeleteSnapshotsMethodSet>(
        client_, std::move(params));
  }

  auto WithBlobName(std::string name) const {
    auto params = params_;
    params.set_blob_name(std::move(name));
    return DeleteBlobBuilder<ContainerNameSet, blob::Yes,
                             DeleteSnapshotsMethodSet>(client_,
                                                       std::move(params));
  }

  auto WithDeleteSnapshotsMethod(DeleteSnapshotsMethod method) const {
    auto params = params_;
    params.set_delete_snapshots_method(method);
    return DeleteBlobBuilder<ContainerNameSet, BlobNameSet, blob::Yes>(
        client_, std::move(params));
  }

  // Optional ones.
  DeleteBlobBuilder WithTimeout(std::uint64_t seconds) const {
    auto copy = *this;
    copy.params_.set_timeout(seconds);
    return copy;
  }

  DeleteBlobBuilder WithLeaseId(LeaseId lease_id) const {
    auto copy = *this;
    copy.params_.set_lease_id(std::move(lease_id));
    return copy;
  }

  DeleteBlobBuilder WithClientRequestId(std::string id) const {
    auto copy = *this;
    copy.params_.set_client_request_id(std::move(id));
    return copy;
  }

  // Accessors. Mandatory parameters can only be read once supplied.
  template <class C = ContainerNameSet,
            class = std::enable_if_t<blob::is_supplied_v<C>>>
  std::string container_name() const {
    return params_.container_name().value();
  }

  template <class B = BlobNameSet,
            class = std::enable_if_t<blob::is_supplied_v<B>>>
  std::string blob_name() const {
    return params_.blob_name().value();
  }

  template <class D = DeleteSnapshotsMethodSet,
            class = std::enable_if_t<blob::is_supplied_v<D>>>
  DeleteSnapshotsMethod delete_snapshots_method() const {
    return params_.delete_snapshots_method().value();
  }

  const std::optional<std::uint64_t>& timeout() const noexcept {
    return params_.timeout();
  }
  const std::optional<LeaseId>& lease_id() const noexcept {
    return params_.lease_id();
  }
  const std::optional<std::string>& client_request_id() const noexcept {
    return params_.client_request_id();
  }
  const DeleteBlobParameters& parameters() const noexcept { return params_; }
  const BlobClient* client() const noexcept { return client_; }

  // Sends the request. Only available once all mandatory parameters are
  // supplied.
  template <class C = ContainerNameSet, class B = BlobNameSet,
            class D = DeleteSnapshotsMethodSet,
            class = std::enable_if_t<blob::is_supplied_v<C> &&
                                     blob::is_supplied_v<B> &&
                                     blob::is_supplied_v<D>>>
  Future<Expected<DeleteBlobResponse, BlobError>> Finalize() && {
    return AsyncDeleteBlob(*client_, std::move(params_));
  }

 private:
  template <class, class, class>
  friend class DeleteBlobBuilder;

  DeleteBlobBuilder(const BlobClient* client, DeleteBlobParameters params)
      : client_(client), params_(std::move(params)) {}

 private:
  const BlobClient* client_;
  DeleteBlobParameters params_;
};

template <class C, class B, class D>
bool operator==(const DeleteBlobBuilder<C, B, D>& left,
                const DeleteBlobBuilder<C, B, D>& right) {
  return left.client() == right.client() &&
         left.parameters() == right.parameters();
}

template <class C, class B, class D>
bool operator!=(const DeleteBlobBuilder<C, B, D>& left,
                const DeleteBlobBuilder<C, B, D>& right) {
  return !(left == right);
}

}  // namespace cirrus

#endif  // CIRRUS_STORAGE_BLOB_OPS_DELETE_BLOB_H_
