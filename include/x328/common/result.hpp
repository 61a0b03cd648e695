#pragma once

#include <utility>
#include <variant>
#include "error_code.hpp"

namespace x328 {

/**
 * @brief Either a value of type T or an ErrorCode
 *
 * Small, allocation-free and copyable when T is. Accessing Value() on an error result is a
 * programming error; check HasValue() (or the bool conversion) first.
 */
template <typename T>
class Result {
 public:
  Result(T value)  // NOLINT(google-explicit-constructor)
      : storage_(std::move(value)) {}
  Result(ErrorCode error)  // NOLINT(google-explicit-constructor)
      : storage_(error) {}

  [[nodiscard]] bool HasValue() const noexcept { return std::holds_alternative<T>(storage_); }
  explicit operator bool() const noexcept { return HasValue(); }

  [[nodiscard]] T const &Value() const & { return std::get<T>(storage_); }
  [[nodiscard]] T &Value() & { return std::get<T>(storage_); }
  [[nodiscard]] T &&Value() && { return std::get<T>(std::move(storage_)); }

  [[nodiscard]] T ValueOr(T fallback) const {
    if (HasValue()) {
      return std::get<T>(storage_);
    }
    return fallback;
  }

  /**
   * @brief The error kind; only meaningful when HasValue() is false
   */
  [[nodiscard]] ErrorCode Error() const noexcept {
    auto const *error = std::get_if<ErrorCode>(&storage_);
    return error != nullptr ? *error : ErrorCode{};
  }

 private:
  std::variant<T, ErrorCode> storage_;
};

/**
 * @brief Result of an operation that only succeeds or fails
 */
template <>
class Result<void> {
 public:
  Result() = default;
  Result(ErrorCode error)  // NOLINT(google-explicit-constructor)
      : error_(error),
        failed_(true) {}

  [[nodiscard]] bool HasValue() const noexcept { return !failed_; }
  explicit operator bool() const noexcept { return HasValue(); }

  [[nodiscard]] ErrorCode Error() const noexcept { return error_; }

 private:
  ErrorCode error_{};
  bool failed_{false};
};

}  // namespace x328
