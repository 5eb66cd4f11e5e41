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

#include "cirrus/storage/blob/blob_error.h"

#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rapidxml/rapidxml.hpp"

#include "cirrus/base/enum.h"
#include "cirrus/base/logging.h"
#include "cirrus/base/string.h"
#include "cirrus/storage/blob/types.h"

using namespace std::literals;

namespace cirrus {

namespace {

constexpr std::string_view kBlobStatusNames[] = {
    "Success"sv,          "MissingParameter"sv,   "TransportError"sv,
    "UnexpectedStatus"sv, "ResponseParseError"sv, "NotOpened"sv};

}  // namespace

std::string_view ToStringView(BlobStatus status) noexcept {
  auto index = underlying_value(status);
  if (CIRRUS_UNLIKELY(index < 0 ||
                      index >= static_cast<int>(std::size(kBlobStatusNames)))) {
    return {};
  }
  return kBlobStatusNames[index];
}

BlobError BlobError::MissingParameter(std::string parameter) {
  BlobError error(BlobStatus::MissingParameter,
                  Format("Mandatory parameter [{}] is not set.", parameter));
  error.parameter_ = std::move(parameter);
  return error;
}

BlobError BlobError::TransportError(Status transport_status) {
  BlobError error(BlobStatus::TransportError,
                  Format("Failed to reach the blob service: {}",
                         transport_status.ToString()));
  error.transport_status_ = std::move(transport_status);
  return error;
}

BlobError BlobError::UnexpectedStatus(HttpStatus received, HttpStatus expected,
                                      std::string body,
                                      std::string service_error_code) {
  BlobError error(
      BlobStatus::UnexpectedStatus,
      Format("Expecting HTTP {}, got HTTP {} {}{}.", underlying_value(expected),
             underlying_value(received), ToStringView(received),
             service_error_code.empty()
                 ? ""
                 : Format(" (service error [{}])", service_error_code)));
  error.http_status_ = received;
  error.expected_http_status_ = expected;
  error.body_ = std::move(body);
  error.service_error_code_ = std::move(service_error_code);
  return error;
}

BlobError BlobError::ResponseParseError(std::string message) {
  return BlobError(BlobStatus::ResponseParseError, std::move(message));
}

BlobError BlobError::NotOpened() {
  return BlobError(BlobStatus::NotOpened,
                   "Blob client has not been opened yet.");
}

std::string BlobError::ToString() const {
  return Format("[{}] {}", ToStringView(code_), message_);
}

namespace blob {

std::string ParseServiceErrorCode(const HttpHeaders& headers,
                                  const std::string& body) {
  if (auto code = headers.TryGet(kErrorCodeHeader); code && !code->empty()) {
    return std::string(*code);
  }
  if (body.empty()) {
    return {};
  }
  // rapidxml parses in place.
  std::vector<char> text(body.begin(), body.end());
  text.push_back(0);
  try {
    rapidxml::xml_document<> doc;
    doc.parse<0>(text.data());
    auto error = doc.first_node("Error");
    auto code = error ? error->first_node("Code") : nullptr;
    if (!code) {
      CIRRUS_LOG_WARNING_EVERY_SECOND(
          "Error code is not present in the blob service's error response.");
      return {};
    }
    return std::string(
        Trim(std::string_view(code->value(), code->value_size())));
  } catch (const rapidxml::parse_error& xcpt) {
    CIRRUS_LOG_WARNING_EVERY_SECOND(
        "Failed to parse error response from the blob service: {}",
        xcpt.what());
    return {};
  }
}

Expected<std::pair<HttpHeaders, std::string>, BlobError> CheckStatusAndExtract(
    BlobTaskCompletion completion, HttpStatus expected) {
  if (completion.status() != expected) {
    auto code =
        ParseServiceErrorCode(*completion.headers(), *completion.body());
    return BlobError::UnexpectedStatus(completion.status(), expected,
                                       std::move(*completion.body()),
                                       std::move(code));
  }
  return std::pair(std::move(*completion.headers()),
                   std::move(*completion.body()));
}

}  // namespace blob

}  // namespace cirrus
