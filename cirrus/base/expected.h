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

#ifndef CIRRUS_BASE_EXPECTED_H_
#define CIRRUS_BASE_EXPECTED_H_

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "cirrus/base/logging.h"

// @sa: http://www.open-std.org/jtc1/sc22/wg21/docs/papers/2018/p0323r6.html

namespace cirrus {

template <class T, class E>
class Expected;

struct unexpect_t {
  explicit unexpect_t() = default;
};

inline constexpr unexpect_t unexpect{};

template <class E>
class Unexpected {
 public:
  template <class Err = E,
            class = std::enable_if_t<std::is_constructible_v<E, Err>>>
  constexpr explicit Unexpected(Err&& e) : value_(std::forward<Err>(e)) {}

  constexpr const E& error() const& noexcept { return value_; }
  constexpr E& error() & noexcept { return value_; }
  constexpr E&& error() && noexcept { return std::move(value_); }

 private:
  E value_;
};

template <class E>
Unexpected(E) -> Unexpected<E>;

namespace detail {

template <class T>
constexpr bool is_expected_v = false;

template <class T, class E>
constexpr bool is_expected_v<Expected<T, E>> = true;

}  // namespace detail

// A low quality mimic of `std::expected<>` (P0323R6).
template <class T, class E>
class Expected {
 public:
  using value_type = T;
  using error_type = E;

  constexpr Expected() = default;
  template <class U, class = std::enable_if_t<std::is_constructible_v<T, U> &&
                                              std::is_convertible_v<U&&, T>>>
  constexpr /* implicit */ Expected(U&& value)
      : value_(std::in_place_index<0>, std::forward<U>(value)) {}
  constexpr /* implicit */ Expected(E error)
      : value_(std::in_place_index<1>, std::move(error)) {}
  template <class G, class = std::enable_if_t<std::is_convertible_v<G, E>>>
  constexpr /* implicit */ Expected(Unexpected<G> u)
      : value_(std::in_place_index<1>, std::move(u).error()) {}
  template <class... Args>
  constexpr explicit Expected(unexpect_t, Args&&... args)
      : value_(std::in_place_index<1>, std::forward<Args>(args)...) {}

  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }
  T& operator*() { return value(); }
  const T& operator*() const { return value(); }
  constexpr bool has_value() const noexcept { return value_.index() == 0; }
  constexpr explicit operator bool() const noexcept { return has_value(); }

  [[nodiscard]] T& value() & {
    CIRRUS_CHECK(has_value(), "Expected has no value");
    return std::get<0>(value_);
  }
  [[nodiscard]] const T& value() const& {
    CIRRUS_CHECK(has_value(), "Expected has no value");
    return std::get<0>(value_);
  }
  [[nodiscard]] T&& value() && {
    CIRRUS_CHECK(has_value(), "Expected has no value");
    return std::move(std::get<0>(value_));
  }

  [[nodiscard]] E& error() & {
    CIRRUS_CHECK(!has_value(), "Expected has no error");
    return std::get<1>(value_);
  }
  [[nodiscard]] const E& error() const& {
    CIRRUS_CHECK(!has_value(), "Expected has no error");
    return std::get<1>(value_);
  }
  [[nodiscard]] E&& error() && {
    CIRRUS_CHECK(!has_value(), "Expected has no error");
    return std::move(std::get<1>(value_));
  }

  template <class U>
  T value_or(U&& alternative) const& {
    if (*this) {
      return value();
    }
    return std::forward<U>(alternative);
  }

  // Calls `f` with the value if there's one, and returns what `f` returns
  // (which must be an `Expected<..., E>`). The error is propagated otherwise.
  template <class F>
  auto and_then(F&& f) && {
    using Ret = std::invoke_result_t<F, T&&>;
    static_assert(detail::is_expected_v<Ret>, "F must return an expected");
    if (*this) {
      return std::invoke(std::forward<F>(f), std::move(*this).value());
    }
    return Ret(unexpect, std::move(*this).error());
  }

 private:
  std::variant<T, E> value_;
};

template <class E>
class Expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  constexpr Expected() = default;
  constexpr /* implicit */ Expected(E error) : error_(std::move(error)) {}
  template <class G, class = std::enable_if_t<std::is_convertible_v<G, E>>>
  constexpr /* implicit */ Expected(Unexpected<G> u)
      : error_(std::move(u).error()) {}
  template <class... Args>
  constexpr explicit Expected(unexpect_t, Args&&... args)
      : error_(std::in_place, std::forward<Args>(args)...) {}

  constexpr explicit operator bool() const noexcept { return !error_; }
  constexpr bool has_value() const noexcept { return !error_; }

  [[nodiscard]] E& error() & {
    CIRRUS_CHECK(!has_value(), "Expected has no error");
    return *error_;
  }
  [[nodiscard]] const E& error() const& {
    CIRRUS_CHECK(!has_value(), "Expected has no error");
    return *error_;
  }
  [[nodiscard]] E&& error() && {
    CIRRUS_CHECK(!has_value(), "Expected has no error");
    return std::move(*error_);
  }

  template <class F>
  auto and_then(F&& f) && {
    using Ret = std::invoke_result_t<F>;
    static_assert(detail::is_expected_v<Ret>, "F must return an expected");
    if (*this) {
      return std::invoke(std::forward<F>(f));
    }
    return Ret(unexpect, std::move(*this).error());
  }

 private:
  std::optional<E> error_;
};

}  // namespace cirrus

#endif  // CIRRUS_BASE_EXPECTED_H_
