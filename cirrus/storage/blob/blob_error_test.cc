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

#include <string>
#include <utility>

#include "gtest/gtest.h"

namespace cirrus::blob {

TEST(BlobError, MissingParameter) {
  auto error = BlobError::MissingParameter("container_name");
  EXPECT_EQ(BlobStatus::MissingParameter, error.code());
  EXPECT_EQ("container_name", error.parameter());
  EXPECT_NE(std::string::npos, error.ToString().find("container_name"));
  EXPECT_NE(std::string::npos, error.ToString().find("MissingParameter"));
}

TEST(BlobError, TransportError) {
  auto error = BlobError::TransportError(Status(28, "Timed out."));
  EXPECT_EQ(BlobStatus::TransportError, error.code());
  EXPECT_EQ(28, error.transport_status().code());
  EXPECT_EQ("Timed out.", error.transport_status().message());
}

TEST(BlobError, UnexpectedStatus) {
  auto error = BlobError::UnexpectedStatus(
      HttpStatus::NotFound, HttpStatus::Accepted, "body", "BlobNotFound");
  EXPECT_EQ(BlobStatus::UnexpectedStatus, error.code());
  EXPECT_EQ(HttpStatus::NotFound, error.http_status());
  EXPECT_EQ(HttpStatus::Accepted, error.expected_http_status());
  EXPECT_EQ("body", error.body());
  EXPECT_EQ("BlobNotFound", error.service_error_code());
  EXPECT_NE(std::string::npos, error.message().find("404"));
  EXPECT_NE(std::string::npos, error.message().find("202"));
  EXPECT_NE(std::string::npos, error.message().find("BlobNotFound"));
}

TEST(BlobError, StatusName) {
  EXPECT_EQ("NotOpened", ToStringView(BlobError::NotOpened().code()));
  EXPECT_EQ("ResponseParseError",
            ToStringView(BlobError::ResponseParseError("x").code()));
}

TEST(ParseServiceErrorCode, FromHeader) {
  HttpHeaders headers;
  headers.Append("x-ms-error-code", "LeaseIdMissing");
  EXPECT_EQ("LeaseIdMissing",
            ParseServiceErrorCode(
                headers, "<Error><Code>SomethingElse</Code></Error>"));
}

TEST(ParseServiceErrorCode, FromBody) {
  static const std::string kBody =
      "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
      "<Error><Code>BlobNotFound</Code>"
      "<Message>The specified blob does not exist.</Message></Error>";
  EXPECT_EQ("BlobNotFound", ParseServiceErrorCode(HttpHeaders(), kBody));
}

TEST(ParseServiceErrorCode, Absent) {
  EXPECT_EQ("", ParseServiceErrorCode(HttpHeaders(), ""));
  EXPECT_EQ("", ParseServiceErrorCode(HttpHeaders(), "<Error></Error>"));
  EXPECT_EQ("", ParseServiceErrorCode(HttpHeaders(), "<Error><Code>"));
  EXPECT_EQ("", ParseServiceErrorCode(HttpHeaders(), "not xml at all"));
}

TEST(CheckStatusAndExtract, Expected) {
  auto result = CheckStatusAndExtract(
      BlobTaskCompletion(HttpStatus::Accepted, {"x-ms-request-id: abc"}, ""),
      HttpStatus::Accepted);
  ASSERT_TRUE(result);
  EXPECT_EQ("abc", result->first.TryGet("x-ms-request-id"));
  EXPECT_TRUE(result->second.empty());
}

TEST(CheckStatusAndExtract, Unexpected) {
  auto result = CheckStatusAndExtract(
      BlobTaskCompletion(HttpStatus::NotFound,
                         {"x-ms-error-code: BlobNotFound"}, "oops"),
      HttpStatus::Accepted);
  ASSERT_FALSE(result);
  EXPECT_EQ(BlobStatus::UnexpectedStatus, result.error().code());
  EXPECT_EQ(HttpStatus::NotFound, result.error().http_status());
  EXPECT_EQ("BlobNotFound", result.error().service_error_code());
  EXPECT_EQ("oops", result.error().body());
}

TEST(CheckStatusAndExtract, ErrorCodeFromBody) {
  static const std::string kBody =
      "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
      "<Error><Code>LeaseIdMismatchWithBlobOperation</Code>"
      "<Message>The lease ID specified did not match.</Message></Error>";
  BlobTaskCompletion completion(HttpStatus::PreconditionFailed,
                                {"x-ms-request-id: abc"}, kBody);
  auto result = CheckStatusAndExtract(std::move(completion),
                                      HttpStatus::Accepted);
  ASSERT_FALSE(result);
  EXPECT_EQ(BlobStatus::UnexpectedStatus, result.error().code());
  EXPECT_EQ(HttpStatus::PreconditionFailed, result.error().http_status());
  EXPECT_EQ(HttpStatus::Accepted, result.error().expected_http_status());
  EXPECT_EQ("LeaseIdMismatchWithBlobOperation",
            result.error().service_error_code());
  EXPECT_EQ(kBody, result.error().body());
}

}  // namespace cirrus::blob
