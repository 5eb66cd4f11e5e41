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

#ifndef CIRRUS_STORAGE_BLOB_TASK_H_
#define CIRRUS_STORAGE_BLOB_TASK_H_

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cirrus/net/http/http_headers.h"
#include "cirrus/net/http/types.h"
#include "cirrus/net/internal/http_task.h"

namespace cirrus::blob {

// Extends `internal::HttpTask`, to do necessary bookkeeping during constructing
// HTTP request to the blob service.
class BlobTask {
 public:
  struct Options {
    // Value of `x-ms-version`.
    std::string api_version;
  };

  // Note that `options` is kept by reference, it's the caller's responsibility
  // to make sure `options` outlives this object.
  explicit BlobTask(const Options* options);

  const Options& options() const noexcept { return *options_; }

  // Modifiers.
  void set_method(HttpMethod method) { method_ = method; }
  void set_uri(std::string uri) { uri_ = std::move(uri); }
  void set_body(std::string body) { body_ = std::move(body); }
  void AddHeader(std::string_view name, std::string_view value);

  // Accessors, they're mostly used by UTs.
  HttpMethod method() const noexcept { return method_; }
  const std::string& uri() const noexcept { return uri_; }
  // In the form of `Name: value`, in the order they're added.
  const std::vector<std::string>& headers() const noexcept { return headers_; }
  const std::string& body() const noexcept { return body_; }

  // Build an HTTP task to send to the blob service. Headers required by the
  // service (`x-ms-version`, `x-ms-date`, `Content-Length`) are added here.
  internal::HttpTask BuildTask() const;

 private:
  const Options* options_;
  HttpMethod method_ = HttpMethod::Unspecified;
  std::string uri_;
  std::vector<std::string> headers_;
  std::string body_;
};

// To make things symmetric, we use `BlobTaskCompletion` for HTTP response.
class BlobTaskCompletion {
 public:
  explicit BlobTaskCompletion(internal::HttpTaskCompletion&& comp);

  // This overload is for testing purpose only. It's used by UT to artificially
  // create "HTTP response". `headers` are in the form of `Name: value`.
  BlobTaskCompletion(HttpStatus status, std::vector<std::string> headers,
                     std::string body);

  // Accessors.
  HttpStatus status() const noexcept { return status_; }
  HttpHeaders* headers() noexcept { return &headers_; }
  const HttpHeaders& headers() const noexcept { return headers_; }
  std::string* body() noexcept { return &body_; }
  const std::string& body() const noexcept { return body_; }

 private:
  HttpStatus status_;
  HttpHeaders headers_;
  std::string body_;
};

}  // namespace cirrus::blob

#endif  // CIRRUS_STORAGE_BLOB_TASK_H_
