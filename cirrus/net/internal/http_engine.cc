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

#include "cirrus/net/internal/http_engine.h"

#include <fcntl.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gflags/gflags.h"

#include "cirrus/base/logging.h"
#include "cirrus/base/string.h"

DEFINE_int32(cirrus_http_engine_max_connections_per_host, 50,
             "Max connections per host kept by the HTTP engine.");
DEFINE_int32(cirrus_http_engine_max_total_connections, 200,
             "Max total connections kept by the HTTP engine.");
DEFINE_bool(cirrus_http_engine_enable_debug, false,
            "If set, debugging output from libcurl is logged.");
DEFINE_bool(cirrus_http_engine_enable_debug_body, false,
            "If set, HTTP body is also logged.");

using namespace std::literals;

namespace cirrus::internal {

namespace {

class Notifier {
 public:
  Notifier() {
    fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    CIRRUS_CHECK_GE(fd_, 0, "Failed to create eventfd.");
  }

  ~Notifier() { close(fd_); }

  void Read() {
    eventfd_t u;
    while (eventfd_read(fd_, &u) == 0) {
      // Empty body
    }
  }

  bool Notify() {
    eventfd_t u = 1;
    return eventfd_write(fd_, u) == 0;
  }

  int Fd() const noexcept { return fd_; }

 private:
  int fd_;
};

size_t HttpWriteCallback(char* ptr, size_t size, size_t nmemb, void* pstr) {
  auto bytes = size * nmemb;
  static_cast<std::string*>(pstr)->append(ptr, bytes);
  return bytes;
}

// The header callback will be called once for each header and only complete
// header lines are passed on to the callback.
size_t HttpHeaderCallback(char* ptr, size_t size, size_t nmemb, void* pstr) {
  std::size_t bytes = size * nmemb;
  std::string_view s(ptr, bytes);
  auto headers = static_cast<std::vector<std::string>*>(pstr);
  if (StartsWith(s, "HTTP/")) {
    // Status-Line. Headers of interim responses (e.g. `100 Continue`) are
    // dropped.
    headers->clear();
    return bytes;
  }
  if (s.find_first_of(':') == std::string_view::npos) {  // Empty line.
    return bytes;
  }
  if (s.size() > 2 && s[bytes - 2] == '\r' && s[bytes - 1] == '\n') {
    s.remove_suffix(2);
  }
  headers->emplace_back(s);
  return bytes;
}

int HttpDebugCallback(CURL* handle, curl_infotype type, char* data, size_t size,
                      void* userptr) {
  std::string_view data_view(data, size);
  if (type == CURLINFO_TEXT || type == CURLINFO_HEADER_IN ||
      type == CURLINFO_HEADER_OUT) {
    CIRRUS_LOG_INFO("[{}] {}", static_cast<int>(type), data_view);
  } else if (type == CURLINFO_DATA_IN || type == CURLINFO_DATA_OUT) {
    if (FLAGS_cirrus_http_engine_enable_debug_body) {
      CIRRUS_LOG_INFO("[{}] {}", static_cast<int>(type), data_view);
    }  // Ignored otherwise.
  }    // Everything else is ignored.
  return 0;
}

class CurlClient {
 public:
  CurlClient() {
    multi_handle_ = curl_multi_init();
    CIRRUS_CHECK(multi_handle_, "Curl multi init failed");
    curl_multi_setopt(multi_handle_, CURLMOPT_MAXCONNECTS,
                      static_cast<long>(  // NOLINT
                          FLAGS_cirrus_http_engine_max_total_connections));
    curl_multi_setopt(multi_handle_, CURLMOPT_MAX_HOST_CONNECTIONS,
                      static_cast<long>(  // NOLINT
                          FLAGS_cirrus_http_engine_max_connections_per_host));
    worker_ = std::thread([this] { LoopPoll(); });
  }

  ~CurlClient() {
    Stop();
    worker_.join();
    curl_multi_cleanup(multi_handle_);
  }

  // Returns false if we're leaving, `ctx` is not consumed in this case.
  bool PushContext(std::unique_ptr<HttpTaskCallContext>* ctx) {
    {
      std::scoped_lock _(pending_lock_);
      if (exiting_.load(std::memory_order_relaxed)) {
        return false;
      }
      pending_.push(std::move(*ctx));
    }
    notifier_.Notify();
    return true;
  }

  void Stop() {
    {
      std::scoped_lock _(pending_lock_);
      exiting_.store(true, std::memory_order_relaxed);
    }
    notifier_.Notify();
  }

 private:
  void LoopPoll() {
    int numfds;
    struct curl_waitfd extra_fds[1];
    extra_fds[0].fd = notifier_.Fd();
    extra_fds[0].events = CURL_WAIT_POLLIN;
    extra_fds[0].revents = 0;
    while (!exiting_.load(std::memory_order_relaxed)) {
      AddHandlers();
      [[maybe_unused]] CURLMcode mc =
          curl_multi_perform(multi_handle_, &still_running_);
      CheckMultiInfo();

      long curl_timeo = -1;  // NOLINT
      curl_multi_timeout(multi_handle_, &curl_timeo);
      if (curl_timeo < 0 || curl_timeo > 1000) {
        curl_timeo = 1000;
      }
      mc = curl_multi_poll(multi_handle_, extra_fds, 1, curl_timeo, &numfds);
      notifier_.Read();
    }
    AbortAll();
  }

  void AddHandlers() {
    std::queue<std::unique_ptr<HttpTaskCallContext>> pending;
    {
      std::scoped_lock _(pending_lock_);
      pending.swap(pending_);
    }
    while (!pending.empty()) {
      auto ctx = std::move(pending.front());
      pending.pop();
      auto handle = ctx->curl_handler;
      CIRRUS_CHECK_EQ(CURLM_OK, curl_multi_add_handle(multi_handle_, handle));
      running_.emplace(handle, std::move(ctx));
    }
  }

  void CheckMultiInfo() {
    CURLMsg* msg;
    int msgs_left;
    while ((msg = curl_multi_info_read(multi_handle_, &msgs_left))) {
      if (msg->msg == CURLMSG_DONE) {
        CURL* e = msg->easy_handle;
        auto result = msg->data.result;
        curl_multi_remove_handle(multi_handle_, e);
        auto iter = running_.find(e);
        CIRRUS_CHECK(iter != running_.end(), "Unknown easy handle completed.");
        auto ctx = std::move(iter->second);
        running_.erase(iter);
        EasyHandlerDone(result, std::move(ctx));
      }
    }
  }

  void EasyHandlerDone(CURLcode result_code,
                       std::unique_ptr<HttpTaskCallContext> ctx) {
    // `done` is kept alive until user's callback returns. The user may free
    // `HttpTaskCompletion` (and therefore `ctx`) in its callback.
    auto done = std::move(ctx->done);
    if (result_code != CURLE_OK) {
      done(Status(result_code, curl_easy_strerror(result_code)));
    } else {
      done(HttpTaskCompletion(std::move(ctx)));
    }
  }

  // Fail everything not yet completed, nobody is going to perform them.
  void AbortAll() {
    AddHandlers();
    for (auto&& [handle, ctx] : running_) {
      curl_multi_remove_handle(multi_handle_, handle);
      EasyHandlerDone(CURLE_ABORTED_BY_CALLBACK, std::move(ctx));
    }
    running_.clear();
  }

 private:
  CURLM* multi_handle_;
  std::atomic<bool> exiting_{false};
  std::thread worker_;
  Notifier notifier_;

  std::mutex pending_lock_;
  std::queue<std::unique_ptr<HttpTaskCallContext>> pending_;

  // Accessed by `worker_` only.
  std::unordered_map<CURL*, std::unique_ptr<HttpTaskCallContext>> running_;
  int still_running_ = 0;
};

std::mutex client_lock;
std::unique_ptr<CurlClient> curl_client;  // Guarded by `client_lock`.
bool curl_initialized = false;

}  // namespace

HttpEngine* HttpEngine::Instance() {
  // Never destroyed.
  static HttpEngine* engine = new HttpEngine();
  return engine;
}

void HttpEngine::StartTask(
    HttpTask task,
    std::function<void(Expected<HttpTaskCompletion, Status>)> done) {
  auto&& ctx = task.ctx_;
  ctx->hdrs = std::move(task.hdrs_);
  if (FLAGS_cirrus_http_engine_enable_debug) {
    CIRRUS_CHECK_EQ(CURLE_OK,
                    curl_easy_setopt(ctx->curl_handler, CURLOPT_DEBUGFUNCTION,
                                     HttpDebugCallback));
    CIRRUS_CHECK_EQ(CURLE_OK,
                    curl_easy_setopt(ctx->curl_handler, CURLOPT_VERBOSE, 1L));
  }
  CIRRUS_CHECK_EQ(CURLE_OK,
                  curl_easy_setopt(ctx->curl_handler, CURLOPT_NOSIGNAL, 1L));
  CIRRUS_CHECK_EQ(CURLE_OK,
                  curl_easy_setopt(ctx->curl_handler, CURLOPT_WRITEFUNCTION,
                                   HttpWriteCallback));
  CIRRUS_CHECK_EQ(CURLE_OK, curl_easy_setopt(ctx->curl_handler,
                                             CURLOPT_WRITEDATA, &ctx->body));
  CIRRUS_CHECK_EQ(CURLE_OK,
                  curl_easy_setopt(ctx->curl_handler, CURLOPT_HEADERFUNCTION,
                                   HttpHeaderCallback));
  CIRRUS_CHECK_EQ(CURLE_OK,
                  curl_easy_setopt(ctx->curl_handler, CURLOPT_HEADERDATA,
                                   &ctx->headers));
  CIRRUS_CHECK_EQ(
      CURLE_OK,
      curl_easy_setopt(ctx->curl_handler, CURLOPT_HTTPHEADER, ctx->hdrs.get()));
  ctx->done = std::move(done);

  bool accepted = false;
  {
    std::scoped_lock _(client_lock);
    if (curl_client) {
      accepted = curl_client->PushContext(&ctx);
    }
  }
  if (!accepted) {
    CIRRUS_LOG_WARNING_EVERY_SECOND(
        "HTTP engine has been stopped, request is dropped.");
    auto done = std::move(ctx->done);
    done(Status(CURLE_ABORTED_BY_CALLBACK, "HTTP engine has been stopped."));
  }
}

void HttpEngine::Stop() {
  std::scoped_lock _(client_lock);
  if (curl_client) {
    curl_client->Stop();
  }
}

void HttpEngine::Join() {
  std::unique_ptr<CurlClient> client;
  {
    std::scoped_lock _(client_lock);
    client = std::move(curl_client);
  }
  client.reset();  // Joins the worker.
  std::scoped_lock _(client_lock);
  if (curl_initialized) {
    curl_global_cleanup();
    curl_initialized = false;
  }
}

HttpEngine::HttpEngine() {
  std::scoped_lock _(client_lock);
  auto ret = curl_global_init(CURL_GLOBAL_DEFAULT);
  CIRRUS_CHECK(!ret, "Curl Init failed {}", static_cast<int>(ret));
  curl_initialized = true;
  curl_client = std::make_unique<CurlClient>();
}

}  // namespace cirrus::internal
