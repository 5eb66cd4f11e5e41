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

#ifndef CIRRUS_BASE_FUTURE_H_
#define CIRRUS_BASE_FUTURE_H_

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

#include "cirrus/base/logging.h"

namespace cirrus {

template <class T>
class Future;

template <class T>
class Promise;

template <class T>
constexpr bool is_future_v = false;

template <class T>
constexpr bool is_future_v<Future<T>> = true;

namespace detail {

// State shared between a `Promise` and its `Future`. The value and the
// continuation meet here, whichever comes last fires the continuation.
template <class T>
class FutureCore {
 public:
  void SetValue(T&& value) {
    std::unique_lock lk(lock_);
    CIRRUS_CHECK(!satisfied_, "Promise is satisfied twice.");
    satisfied_ = true;
    if (!continuation_) {
      value_.emplace(std::move(value));
      return;
    }
    auto cont = std::move(continuation_);
    lk.unlock();
    cont(std::move(value));
  }

  void SetContinuation(std::function<void(T&&)> continuation) {
    std::unique_lock lk(lock_);
    CIRRUS_CHECK(!continuation_, "Continuation is chained twice.");
    if (!value_) {
      continuation_ = std::move(continuation);
      return;
    }
    auto value = std::move(*value_);
    value_.reset();
    lk.unlock();
    continuation(std::move(value));
  }

 private:
  std::mutex lock_;
  bool satisfied_ = false;
  std::optional<T> value_;
  std::function<void(T&&)> continuation_;
};

}  // namespace detail

// `Future` can be used to receive result from an asynchronous operation.
//
// If the `Future` is destroyed before the operation completes, the operation is
// detached (i.e., the result is discarded.).
template <class T>
class Future {
 public:
  using value_type = T;

  // Default constructor constructs an empty future which is not of much use
  // except for being a placeholder.
  Future() = default;

  // Construct a "ready" future from an immediate value.
  template <class U,
            class = std::enable_if_t<std::is_constructible_v<T, U&&> &&
                                     !is_future_v<std::decay_t<U>>>>
  /* implicit */ Future(U&& value)
      : core_(std::make_shared<detail::FutureCore<T>>()) {
    core_->SetValue(T(std::forward<U>(value)));
  }

  // Non-copyable.
  Future(const Future&) = delete;
  Future& operator=(const Future&) = delete;
  // Movable.
  Future(Future&&) = default;
  Future& operator=(Future&&) = default;

  // `Then` chains a continuation to `Future`. The continuation is called
  // with the value once the `Future` is satisfied, and a `Future` satisfied
  // with whatever the continuation returns is returned.
  //
  // If the value is already there, `continuation` is called immediately in the
  // caller's thread. Otherwise it's called in the thread satisfying the
  // promise.
  //
  // `Then` is only allowed on rvalue-ref, use `std::move(future)` when needed.
  template <class F>
  auto Then(F&& continuation) &&;

 private:
  friend class Promise<T>;
  template <class U>
  friend U BlockingGet(Future<U>&& future);

  explicit Future(std::shared_ptr<detail::FutureCore<T>> core)
      : core_(std::move(core)) {}

  std::shared_ptr<detail::FutureCore<T>> core_;
};

// `Promise` is used to notify the holder of `Future` about event completion.
// It's valid even if it's orphaned (i.e., the corresponding `Future` is
// destroyed).
//
// Copies of a `Promise` refer to the same shared state, so a `Promise` can be
// captured by callbacks stored in `std::function`.
template <class T>
class Promise {
 public:
  Promise() : core_(std::make_shared<detail::FutureCore<T>>()) {}

  // Returns: `Future` that is satisfied when `SetValue` is called.
  //
  // May only be called once.
  Future<T> GetFuture() { return Future<T>(core_); }

  // Satisfy the future.
  template <class... Us, class = std::enable_if_t<
                             std::is_constructible_v<T, Us&&...>>>
  void SetValue(Us&&... values) {
    core_->SetValue(T(std::forward<Us>(values)...));
  }

 private:
  std::shared_ptr<detail::FutureCore<T>> core_;
};

// Block the calling thread until `future` is satisfied, and return its value.
template <class T>
T BlockingGet(Future<T>&& future) {
  CIRRUS_CHECK(future.core_, "Waiting on an empty future.");
  std::mutex lock;
  std::condition_variable cv;
  std::optional<T> receiver;

  std::move(future).core_->SetContinuation([&](T&& value) {
    std::scoped_lock _(lock);
    receiver.emplace(std::move(value));
    cv.notify_one();
  });

  std::unique_lock lk(lock);
  cv.wait(lk, [&] { return receiver.has_value(); });
  return std::move(*receiver);
}

///////////////////////////////////////
// Implementation goes below.        //
///////////////////////////////////////

template <class T>
template <class F>
auto Future<T>::Then(F&& continuation) && {
  using R = std::invoke_result_t<F, T&&>;
  static_assert(!std::is_void_v<R> && !is_future_v<R>,
                "Continuation must return an immediate value.");
  CIRRUS_CHECK(core_, "Calling `Then` on an empty future.");

  Promise<R> promise;
  auto result = promise.GetFuture();
  // `std::function` requires a copyable target, hence the `shared_ptr`.
  auto cont = std::make_shared<std::decay_t<F>>(std::forward<F>(continuation));
  auto core = std::move(core_);
  core->SetContinuation([promise, cont](T&& value) mutable {
    promise.SetValue(std::invoke(*cont, std::move(value)));
  });
  return result;
}

}  // namespace cirrus

#endif  // CIRRUS_BASE_FUTURE_H_
