/**
 * @file result.hpp
 * @brief Result type wrapping esp_err_t
 */

#pragma once

#include <esp_err.h>

#include <type_traits>
#include <utility>

namespace core {

/// Error carrier accepted by every Result<T>
struct Error {
  esp_err_t code;
};

/// Build an error (ESP_OK is promoted to ESP_FAIL)
[[nodiscard]] constexpr Error Err(esp_err_t err) noexcept {
  return Error{err == ESP_OK ? ESP_FAIL : err};
}

/// Result type for failable operations
template <typename T> class Result {
public:
  Result(const T &value) : value_(value), error_(ESP_OK) {}
  Result(T &&value) : value_(std::move(value)), error_(ESP_OK) {}
  Result(Error err) : value_{}, error_(err.code) {}

  [[nodiscard]] bool ok() const noexcept { return error_ == ESP_OK; }
  [[nodiscard]] explicit operator bool() const noexcept { return ok(); }
  [[nodiscard]] esp_err_t error() const noexcept { return error_; }

  [[nodiscard]] T &value() & noexcept { return value_; }
  [[nodiscard]] const T &value() const & noexcept { return value_; }
  [[nodiscard]] T &&value() && noexcept { return std::move(value_); }

  [[nodiscard]] T *operator->() noexcept { return &value_; }
  [[nodiscard]] const T *operator->() const noexcept { return &value_; }
  [[nodiscard]] T &operator*() & noexcept { return value_; }
  [[nodiscard]] const T &operator*() const & noexcept { return value_; }
  [[nodiscard]] T &&operator*() && noexcept { return std::move(value_); }

  template <typename U> [[nodiscard]] T value_or(U &&default_val) const & {
    return ok() ? value_ : static_cast<T>(std::forward<U>(default_val));
  }

private:
  static_assert(std::is_default_constructible_v<T>,
                "Result<T> requires a default-constructible T");

  T value_;
  esp_err_t error_;
};

/// Specialization for void
template <> class Result<void> {
public:
  Result() : error_(ESP_OK) {}
  Result(Error err) : error_(err.code) {}

  /// Wrap a raw ESP-IDF return code (ESP_OK means success)
  static Result from(esp_err_t err) {
    return err == ESP_OK ? Result{} : Result{Error{err}};
  }

  [[nodiscard]] bool ok() const noexcept { return error_ == ESP_OK; }
  [[nodiscard]] explicit operator bool() const noexcept { return ok(); }
  [[nodiscard]] esp_err_t error() const noexcept { return error_; }

private:
  esp_err_t error_;
};

using Status = Result<void>;

/// Successful Status
[[nodiscard]] inline Status Ok() noexcept { return {}; }

} // namespace core
