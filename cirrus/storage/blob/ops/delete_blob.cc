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

#include "cirrus/storage/blob/ops/delete_blob.h"

#include <string>
#include <utility>

#include "cirrus/base/logging.h"
#include "cirrus/base/string.h"
#include "cirrus/net/http/date.h"
#include "cirrus/storage/blob/blob_client.h"
#include "cirrus/storage/blob/resource_uri.h"

namespace cirrus {

void DeleteBlobParameters::set_container_name(std::string name) {
  container_name_ = std::move(name);
  supplied_ |= DeleteBlobField::ContainerName;
}

void DeleteBlobParameters::set_blob_name(std::string name) {
  blob_name_ = std::move(name);
  supplied_ |= DeleteBlobField::BlobName;
}

void DeleteBlobParameters::set_delete_snapshots_method(
    DeleteSnapshotsMethod method) {
  delete_snapshots_method_ = method;
  supplied_ |= DeleteBlobField::DeleteSnapshotsMethod;
}

Expected<std::string, BlobError> DeleteBlobParameters::container_name() const {
  if (!(supplied_ & DeleteBlobField::ContainerName)) {
    return BlobError::MissingParameter("container_name");
  }
  return container_name_;
}

Expected<std::string, BlobError> DeleteBlobParameters::blob_name() const {
  if (!(supplied_ & DeleteBlobField::BlobName)) {
    return BlobError::MissingParameter("blob_name");
  }
  return blob_name_;
}

Expected<DeleteSnapshotsMethod, BlobError>
DeleteBlobParameters::delete_snapshots_method() const {
  if (!(supplied_ & DeleteBlobField::DeleteSnapshotsMethod)) {
    return BlobError::MissingParameter("delete_snapshots_method");
  }
  return delete_snapshots_method_;
}

Expected<void, BlobError> DeleteBlobParameters::Validate() const {
  if (auto v = container_name(); !v) {
    return std::move(v).error();
  }
  if (auto v = blob_name(); !v) {
    return std::move(v).error();
  }
  if (auto v = delete_snapshots_method(); !v) {
    return std::move(v).error();
  }
  return {};
}

bool operator==(const DeleteBlobParameters& left,
                const DeleteBlobParameters& right) {
  return left.supplied_ == right.supplied_ &&
         left.container_name_ == right.container_name_ &&
         left.blob_name_ == right.blob_name_ &&
         left.delete_snapshots_method_ == right.delete_snapshots_method_ &&
         left.timeout_ == right.timeout_ && left.lease_id_ == right.lease_id_ &&
         left.client_request_id_ == right.client_request_id_;
}

Expected<DeleteBlobResponse, BlobError> DeleteBlobResponse::FromHeaders(
    const HttpHeaders& headers) {
  DeleteBlobResponse result;

  auto request_id = headers.TryGet(blob::kRequestIdHeader);
  if (!request_id || request_id->empty()) {
    return BlobError::ResponseParseError(
        Format("Header [{}] is missing from the response.",
               blob::kRequestIdHeader));
  }
  result.request_id = std::string(*request_id);

  if (auto id = headers.TryGet(blob::kClientRequestIdHeader)) {
    result.client_request_id = std::string(*id);
  }
  if (auto version = headers.TryGet(blob::kVersionHeader)) {
    result.version = std::string(*version);
  }
  if (auto date = headers.TryGet("Date")) {
    auto parsed = TryParseHttpDate(*date);
    if (!parsed) {
      return BlobError::ResponseParseError(
          Format("Malformed header [Date]: [{}].", *date));
    }
    result.date = *parsed;
  }
  return result;
}

Future<Expected<DeleteBlobResponse, BlobError>> AsyncDeleteBlob(
    const BlobClient& client, DeleteBlobParameters params) {
  if (auto valid = params.Validate(); !valid) {
    return std::move(valid).error();
  }

  auto uri = blob::GenerateBlobUri(client.service_root(),
                                   params.container_name().value(),
                                   params.blob_name().value());
  if (auto timeout = params.timeout()) {
    uri += Format("?timeout={}", *timeout);
  }
  CIRRUS_VLOG(1, "Deleting blob [{}].", uri);

  auto add_headers = [params = std::move(params)](blob::BlobTask* task) {
    task->AddHeader(blob::kDeleteSnapshotsHeader,
                    ToStringView(params.delete_snapshots_method().value()));
    if (auto&& lease_id = params.lease_id()) {
      task->AddHeader(blob::kLeaseIdHeader, lease_id->ToString());
    }
    if (auto&& id = params.client_request_id()) {
      task->AddHeader(blob::kClientRequestIdHeader, *id);
    }
  };
  return client.PerformRequest(uri, HttpMethod::Delete, add_headers, "")
      .Then([](Expected<blob::BlobTaskCompletion, BlobError> completion)
                -> Expected<DeleteBlobResponse, BlobError> {
        if (!completion) {
          return std::move(completion).error();
        }
        return blob::CheckStatusAndExtract(std::move(*completion),
                                           HttpStatus::Accepted)
            .and_then([](std::pair<HttpHeaders, std::string> extracted) {
              return DeleteBlobResponse::FromHeaders(extracted.first);
            });
      });
}

Expected<DeleteBlobResponse, BlobError> DeleteBlob(
    const BlobClient& client, DeleteBlobParameters params) {
  return BlockingGet(AsyncDeleteBlob(client, std::move(params)));
}

}  // namespace cirrus
