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

#include <chrono>
#include <string>

#include "curl/curl.h"
#include "gtest/gtest.h"

#include "cirrus/base/string.h"
#include "cirrus/testing/http_server.h"
#include "cirrus/testing/main.h"

using namespace std::literals;

namespace cirrus {

TEST(BlobClient, OpenAzblob) {
  BlobClient client;
  ASSERT_TRUE(client.Open("azblob://myaccount"));
  EXPECT_EQ("myaccount", client.account());
  EXPECT_EQ("https://myaccount.blob.core.windows.net", client.service_root());
  EXPECT_EQ(FLAGS_cirrus_blob_api_version, client.options().api_version);
}

TEST(BlobClient, OpenWithOptions) {
  BlobClient::Options opts;
  opts.account = "another";
  opts.endpoint_suffix = "core.chinacloudapi.cn";
  opts.api_version = "2020-04-08";

  BlobClient client;
  ASSERT_TRUE(client.Open("azblob://myaccount", opts));
  EXPECT_EQ("another", client.account());
  EXPECT_EQ("https://another.blob.core.chinacloudapi.cn",
            client.service_root());
  EXPECT_EQ("2020-04-08", client.options().api_version);

  ASSERT_TRUE(client.Open("azblob://", opts));
  EXPECT_EQ("another", client.account());
}

TEST(BlobClient, OpenPathStyle) {
  BlobClient client;
  ASSERT_TRUE(client.Open("http://127.0.0.1:10000/devstoreaccount1/"));
  EXPECT_EQ("devstoreaccount1", client.account());
  EXPECT_EQ("http://127.0.0.1:10000/devstoreaccount1", client.service_root());
}

TEST(BlobClient, OpenInvalid) {
  BlobClient client;
  EXPECT_FALSE(client.Open("myaccount"));
  EXPECT_FALSE(client.Open("ftp://myaccount"));
  EXPECT_FALSE(client.Open("azblob://"));
  EXPECT_FALSE(client.Open("azblob://my/account"));
  EXPECT_FALSE(client.Open("http://127.0.0.1:10000"));
  EXPECT_FALSE(client.Open("http:///devstoreaccount1"));
}

TEST(BlobClient, NotOpened) {
  BlobClient client;
  auto result = BlockingGet(client.PerformRequest(
      "https://myaccount.blob.core.windows.net/c/b", HttpMethod::Delete,
      nullptr, ""));
  ASSERT_FALSE(result);
  EXPECT_EQ(BlobStatus::NotOpened, result.error().code());

  // A failed `Open` leaves the client unusable as well.
  EXPECT_FALSE(client.Open("ftp://myaccount"));
  result = BlockingGet(client.PerformRequest(
      "https://myaccount.blob.core.windows.net/c/b", HttpMethod::Delete,
      nullptr, ""));
  ASSERT_FALSE(result);
  EXPECT_EQ(BlobStatus::NotOpened, result.error().code());
}

TEST(BlobClient, PerformRequest) {
  testing::CannedHttpServer server(
      "HTTP/1.1 202 Accepted\r\n"
      "x-ms-request-id: abc\r\n"
      "Content-Length: 0\r\n"
      "Connection: close\r\n\r\n");

  BlobClient client;
  ASSERT_TRUE(client.Open(server.url() + "/devstoreaccount1"));
  auto result = BlockingGet(client.PerformRequest(
      client.service_root() + "/container/blob", HttpMethod::Delete,
      [](blob::BlobTask* task) { task->AddHeader("x-ms-meta-test", "1"); },
      "", 5s));
  ASSERT_TRUE(result) << result.error().ToString();
  EXPECT_EQ(HttpStatus::Accepted, result->status());
  EXPECT_EQ("abc", result->headers()->TryGet("x-ms-request-id"));

  auto request = server.WaitForRequest();
  EXPECT_TRUE(StartsWith(
      request, "DELETE /devstoreaccount1/container/blob HTTP/1.1\r\n"))
      << request;
  EXPECT_NE(std::string::npos,
            request.find("\r\nx-ms-version: " + FLAGS_cirrus_blob_api_version +
                         "\r\n"));
  EXPECT_NE(std::string::npos, request.find("\r\nx-ms-date: "));
  EXPECT_NE(std::string::npos, request.find("\r\nContent-Length: 0\r\n"));
  EXPECT_NE(std::string::npos, request.find("\r\nx-ms-meta-test: 1\r\n"));
  EXPECT_EQ(std::string::npos, request.find("\r\nAccept:"));
}

TEST(BlobClient, TransportError) {
  std::string url;
  {
    // Grab a port nobody is listening on.
    testing::CannedHttpServer server("");
    url = server.url();
  }

  BlobClient client;
  ASSERT_TRUE(client.Open(url + "/devstoreaccount1"));
  auto result = BlockingGet(client.PerformRequest(
      client.service_root() + "/container/blob", HttpMethod::Delete, nullptr,
      "", 5s));
  ASSERT_FALSE(result);
  EXPECT_EQ(BlobStatus::TransportError, result.error().code());
  EXPECT_EQ(CURLE_COULDNT_CONNECT, result.error().transport_status().code());
}

TEST(BlobClient, Timeout) {
  testing::CannedHttpServer server("");  // Never responds.

  BlobClient::Options opts;
  opts.timeout = 100ms;
  BlobClient client;
  ASSERT_TRUE(client.Open(server.url() + "/devstoreaccount1", opts));
  auto result = BlockingGet(client.PerformRequest(
      client.service_root() + "/container/blob", HttpMethod::Delete, nullptr,
      ""));
  ASSERT_FALSE(result);
  EXPECT_EQ(BlobStatus::TransportError, result.error().code());
  EXPECT_EQ(CURLE_OPERATION_TIMEDOUT,
            result.error().transport_status().code());
}

}  // namespace cirrus

CIRRUS_TEST_MAIN
