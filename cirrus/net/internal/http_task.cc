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

#include "cirrus/net/internal/http_task.h"

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "cirrus/base/enum.h"
#include "cirrus/base/logging.h"

using namespace std::literals;

namespace cirrus::internal {

namespace {

size_t HttpReadCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto body = reinterpret_cast<HttpTaskCallContext::RequestBody*>(userdata);
  auto n_copy = std::min(body->buffer.size() - body->pos, size * nmemb);
  memcpy(ptr, body->buffer.data() + body->pos, n_copy);
  body->pos += n_copy;
  return n_copy;
}

int HttpSeekCallback(void* userdata, curl_off_t offset, int origin) {
  auto body = reinterpret_cast<HttpTaskCallContext::RequestBody*>(userdata);
  // libcurl currently only passes `SEEK_SET`.
  if (origin != SEEK_SET || offset < 0 ||
      static_cast<std::size_t>(offset) > body->buffer.size()) {
    return CURL_SEEKFUNC_CANTSEEK;
  }
  body->pos = offset;
  return CURL_SEEKFUNC_OK;
}

}  // namespace

HttpTaskCallContext::HttpTaskCallContext()
    : curl_handler(curl_easy_init()), hdrs(nullptr, &curl_slist_free_all) {
  CIRRUS_CHECK(curl_handler, "Failed to create libcurl easy handle.");
}

HttpTaskCallContext::~HttpTaskCallContext() { curl_easy_cleanup(curl_handler); }

HttpTask::HttpTask() : ctx_(std::make_unique<HttpTaskCallContext>()) {}

HttpTask::~HttpTask() = default;

HttpTask::HttpTask(HttpTask&&) noexcept = default;

void HttpTask::SetUrl(const std::string& url) {
  CIRRUS_CHECK_EQ(
      CURLE_OK, curl_easy_setopt(ctx_->curl_handler, CURLOPT_URL, url.c_str()));
}

void HttpTask::SetMethod(HttpMethod method) {
  method_ = method;
  if (method == HttpMethod::Head) {
    CIRRUS_CHECK_EQ(CURLE_OK,
                    curl_easy_setopt(ctx_->curl_handler, CURLOPT_NOBODY, 1L));
  } else if (method == HttpMethod::Get) {
    CIRRUS_CHECK_EQ(CURLE_OK,
                    curl_easy_setopt(ctx_->curl_handler, CURLOPT_HTTPGET, 1L));
  } else if (method == HttpMethod::Post) {
    CIRRUS_CHECK_EQ(CURLE_OK,
                    curl_easy_setopt(ctx_->curl_handler, CURLOPT_POST, 1L));
  } else if (method == HttpMethod::Put) {
    CIRRUS_CHECK_EQ(CURLE_OK,
                    curl_easy_setopt(ctx_->curl_handler, CURLOPT_UPLOAD, 1L));
  } else if (method == HttpMethod::Delete) {
    CIRRUS_CHECK_EQ(CURLE_OK, curl_easy_setopt(ctx_->curl_handler,
                                               CURLOPT_CUSTOMREQUEST,
                                               "DELETE"));
  } else {
    CIRRUS_UNEXPECTED("Unsupported HTTP method #{}.", underlying_value(method));
  }
}

void HttpTask::SetTimeout(std::chrono::nanoseconds timeout) {
  CIRRUS_CHECK_EQ(CURLE_OK,
                  curl_easy_setopt(ctx_->curl_handler, CURLOPT_TIMEOUT_MS,
                                   static_cast<long>(timeout / 1ms)));  // NOLINT
}

void HttpTask::SetBody(std::string body) {
  CIRRUS_CHECK(method_ != HttpMethod::Unspecified);
  CIRRUS_CHECK(method_ != HttpMethod::Head && method_ != HttpMethod::Get,
               "HEAD/GET request should not carry a body.");

  ctx_->request_body.buffer = std::move(body);
  ctx_->request_body.pos = 0;
  auto size = static_cast<curl_off_t>(ctx_->request_body.buffer.size());

  if (method_ == HttpMethod::Post) {
    CIRRUS_CHECK_EQ(CURLE_OK,
                    curl_easy_setopt(ctx_->curl_handler,
                                     CURLOPT_POSTFIELDSIZE_LARGE, size));
  } else if (method_ == HttpMethod::Put) {
    CIRRUS_CHECK_EQ(CURLE_OK, curl_easy_setopt(ctx_->curl_handler,
                                               CURLOPT_INFILESIZE_LARGE, size));
  } else {
    CIRRUS_UNEXPECTED("Unexpected HTTP method #{}.", underlying_value(method_));
  }

  CIRRUS_CHECK_EQ(CURLE_OK,
                  curl_easy_setopt(ctx_->curl_handler, CURLOPT_READFUNCTION,
                                   HttpReadCallback));
  CIRRUS_CHECK_EQ(CURLE_OK,
                  curl_easy_setopt(ctx_->curl_handler, CURLOPT_READDATA,
                                   &ctx_->request_body));
  CIRRUS_CHECK_EQ(CURLE_OK,
                  curl_easy_setopt(ctx_->curl_handler, CURLOPT_SEEKFUNCTION,
                                   HttpSeekCallback));
  CIRRUS_CHECK_EQ(CURLE_OK,
                  curl_easy_setopt(ctx_->curl_handler, CURLOPT_SEEKDATA,
                                   &ctx_->request_body));
}

void HttpTask::AddHeader(const std::string& header) {
  hdrs_.reset(curl_slist_append(hdrs_.release(), header.c_str()));
}

HttpTaskCompletion::HttpTaskCompletion(std::unique_ptr<HttpTaskCallContext> ctx)
    : ctx_(std::move(ctx)) {}

HttpTaskCompletion::~HttpTaskCompletion() = default;

HttpTaskCompletion::HttpTaskCompletion(HttpTaskCompletion&&) noexcept = default;

HttpTaskCompletion& HttpTaskCompletion::operator=(
    HttpTaskCompletion&&) noexcept = default;

std::string* HttpTaskCompletion::body() noexcept { return &ctx_->body; }

std::vector<std::string>* HttpTaskCompletion::headers() noexcept {
  return &ctx_->headers;
}

HttpStatus HttpTaskCompletion::status() noexcept {
  long resp_code = 0;  // NOLINT
  curl_easy_getinfo(ctx_->curl_handler, CURLINFO_RESPONSE_CODE, &resp_code);
  return static_cast<HttpStatus>(resp_code);
}

}  // namespace cirrus::internal
