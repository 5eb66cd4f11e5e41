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

#ifndef CIRRUS_NET_HTTP_TYPES_H_
#define CIRRUS_NET_HTTP_TYPES_H_

#include <string_view>

namespace cirrus {

enum class HttpMethod {
  Unspecified,  // Not set yet. `HttpTask` refuses to send it.
  Head,
  Get,
  Post,
  Put,
  Delete
};

// Status codes the blob service is documented to respond with.
//
// @sa: https://docs.microsoft.com/en-us/rest/api/storageservices/status-and-error-codes2
enum class HttpStatus {
  OK = 200,
  Created = 201,
  Accepted = 202,
  NoContent = 204,
  PartialContent = 206,
  NotModified = 304,
  BadRequest = 400,
  Unauthorized = 401,
  Forbidden = 403,
  NotFound = 404,
  MethodNotAllowed = 405,
  Conflict = 409,
  LengthRequired = 411,
  PreconditionFailed = 412,
  PayloadTooLarge = 413,
  RangeNotSatisfiable = 416,
  InternalServerError = 500,
  NotImplemented = 501,
  ServiceUnavailable = 503,
  GatewayTimeout = 504
};

// Reason phrase of `status`. Empty for codes not listed above, which may still
// be received from the service.
std::string_view ToStringView(HttpStatus status) noexcept;

}  // namespace cirrus

#endif  // CIRRUS_NET_HTTP_TYPES_H_
