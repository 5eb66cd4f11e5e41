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

#ifndef CIRRUS_STORAGE_BLOB_BLOB_ERROR_H_
#define CIRRUS_STORAGE_BLOB_BLOB_ERROR_H_

#include <string>
#include <string_view>
#include <utility>

#include "cirrus/base/expected.h"
#include "cirrus/base/status.h"
#include "cirrus/net/http/http_headers.h"
#include "cirrus/net/http/types.h"
#include "cirrus/storage/blob/task.h"

namespace cirrus {

enum class BlobStatus {
  Success = 0,  // Hardly used.

  // A mandatory parameter was not supplied. Only possible when parameters are
  // filled at runtime (@sa: `DeleteBlobParameters`).
  MissingParameter = 1,

  // Failed to talk to the service (connection failure, timeout, ...).
  TransportError = 2,

  // The service responded with a status code other than the expected one.
  UnexpectedStatus = 3,

  // Expected status code was received but the response could not be decoded.
  ResponseParseError = 4,

  // Blob client has not yet been opened successfully.
  NotOpened = 5,
};

std::string_view ToStringView(BlobStatus status) noexcept;

// Describes why an operation on the blob service failed.
//
// Besides the status code, each kind of failure carries its own details,
// accessors for details of other kinds return empty values.
class BlobError {
 public:
  static BlobError MissingParameter(std::string parameter);
  static BlobError TransportError(Status transport_status);
  static BlobError UnexpectedStatus(HttpStatus received, HttpStatus expected,
                                    std::string body,
                                    std::string service_error_code);
  static BlobError ResponseParseError(std::string message);
  static BlobError NotOpened();

  BlobStatus code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }

  // `MissingParameter`: Name of the missing parameter, e.g. `blob_name`.
  const std::string& parameter() const noexcept { return parameter_; }

  // `TransportError`: Status reported by the transport, as is.
  const Status& transport_status() const noexcept { return transport_status_; }

  // `UnexpectedStatus`.
  HttpStatus http_status() const noexcept { return http_status_; }
  HttpStatus expected_http_status() const noexcept {
    return expected_http_status_;
  }
  const std::string& body() const noexcept { return body_; }
  // e.g. `BlobNotFound`, `LeaseIdMissing`. Empty if the service did not say.
  //
  // @sa: https://docs.microsoft.com/en-us/rest/api/storageservices/blob-service-error-codes
  const std::string& service_error_code() const noexcept {
    return service_error_code_;
  }

  // Returns a human readable string describing the error.
  std::string ToString() const;

 private:
  BlobError(BlobStatus code, std::string message)
      : code_(code), message_(std::move(message)) {}

 private:
  BlobStatus code_;
  std::string message_;
  std::string parameter_;
  Status transport_status_;
  HttpStatus http_status_{};
  HttpStatus expected_http_status_{};
  std::string body_;
  std::string service_error_code_;
};

namespace blob {

// Extracts error code from an error response. `x-ms-error-code` is preferred,
// `<Error><Code>` in the XML body is used otherwise.
//
// Empty string is returned if neither is present.
std::string ParseServiceErrorCode(const HttpHeaders& headers,
                                  const std::string& body);

// Checks that `completion` carries `expected` status and hands out its headers
// and body. `UnexpectedStatus` is returned otherwise.
Expected<std::pair<HttpHeaders, std::string>, BlobError> CheckStatusAndExtract(
    BlobTaskCompletion completion, HttpStatus expected);

}  // namespace blob

}  // namespace cirrus

#endif  // CIRRUS_STORAGE_BLOB_BLOB_ERROR_H_
