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

#include "cirrus/net/http/types.h"

#include <string_view>

using namespace std::literals;

namespace cirrus {

std::string_view ToStringView(HttpStatus status) noexcept {
  switch (status) {
    case HttpStatus::OK:
      return "OK"sv;
    case HttpStatus::Created:
      return "Created"sv;
    case HttpStatus::Accepted:
      return "Accepted"sv;
    case HttpStatus::NoContent:
      return "No Content"sv;
    case HttpStatus::PartialContent:
      return "Partial Content"sv;
    case HttpStatus::NotModified:
      return "Not Modified"sv;
    case HttpStatus::BadRequest:
      return "Bad Request"sv;
    case HttpStatus::Unauthorized:
      return "Unauthorized"sv;
    case HttpStatus::Forbidden:
      return "Forbidden"sv;
    case HttpStatus::NotFound:
      return "Not Found"sv;
    case HttpStatus::MethodNotAllowed:
      return "Method Not Allowed"sv;
    case HttpStatus::Conflict:
      return "Conflict"sv;
    case HttpStatus::LengthRequired:
      return "Length Required"sv;
    case HttpStatus::PreconditionFailed:
      return "Precondition Failed"sv;
    case HttpStatus::PayloadTooLarge:
      return "Payload Too Large"sv;
    case HttpStatus::RangeNotSatisfiable:
      return "Range Not Satisfiable"sv;
    case HttpStatus::InternalServerError:
      return "Internal Server Error"sv;
    case HttpStatus::NotImplemented:
      return "Not Implemented"sv;
    case HttpStatus::ServiceUnavailable:
      return "Service Unavailable"sv;
    case HttpStatus::GatewayTimeout:
      return "Gateway Timeout"sv;
  }
  return {};
}

}  // namespace cirrus
