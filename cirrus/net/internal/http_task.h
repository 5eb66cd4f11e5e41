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

#ifndef CIRRUS_NET_INTERNAL_HTTP_TASK_H_
#define CIRRUS_NET_INTERNAL_HTTP_TASK_H_

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "curl/curl.h"

#include "cirrus/base/expected.h"
#include "cirrus/base/status.h"
#include "cirrus/net/http/types.h"

namespace cirrus::internal {

struct HttpTaskCallContext;

// A single request for `HttpEngine::StartTask`, backed by a libcurl easy
// handle. URL and timeout must be set.
class HttpTask {
 public:
  HttpTask();
  ~HttpTask();
  HttpTask(HttpTask&&) noexcept;

  // Call this before `SetBody`. Only PUT and POST may carry a body.
  void SetMethod(HttpMethod method);
  void SetUrl(const std::string& url);
  void SetTimeout(std::chrono::nanoseconds timeout);
  void SetBody(std::string body);

  // A full header line. `"Name:"` (without value) suppresses a header libcurl
  // would otherwise add.
  void AddHeader(const std::string& header);

 private:
  friend class HttpEngine;
  HttpMethod method_ = HttpMethod::Unspecified;
  std::unique_ptr<HttpTaskCallContext> ctx_;
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> hdrs_{
      nullptr, &curl_slist_free_all};
};

// Response of a finished `HttpTask`. Transport failures never get here.
class HttpTaskCompletion {
 public:
  explicit HttpTaskCompletion(std::unique_ptr<HttpTaskCallContext> ctx);
  ~HttpTaskCompletion();
  HttpTaskCompletion(HttpTaskCompletion&&) noexcept;
  HttpTaskCompletion& operator=(HttpTaskCompletion&&) noexcept;

  HttpStatus status() noexcept;

  // Header lines of the final response, e.g. `x-ms-request-id: abc`. Lines of
  // interim responses (`100 Continue`) are not included.
  std::vector<std::string>* headers() noexcept;
  std::string* body() noexcept;

 private:
  std::unique_ptr<HttpTaskCallContext> ctx_;
};

// Shared by `HttpTask`, `HttpEngine` and `HttpTaskCompletion`. Lives as long
// as the easy handle it owns.
struct HttpTaskCallContext {
  HttpTaskCallContext();
  ~HttpTaskCallContext();

  CURL* curl_handler;

  // Filled in by `HttpEngine`'s libcurl callbacks.
  std::string body;
  std::vector<std::string> headers;

  std::function<void(Expected<HttpTaskCompletion, Status>)> done;
  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> hdrs;

  // Consumed by libcurl's read callback, rewound by its seek callback.
  struct RequestBody {
    std::string buffer;
    std::size_t pos = 0;
  };
  RequestBody request_body;
};

}  // namespace cirrus::internal

#endif  // CIRRUS_NET_INTERNAL_HTTP_TASK_H_
