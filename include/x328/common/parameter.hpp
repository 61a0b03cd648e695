#pragma once

#include <cstdint>
#include "result.hpp"

namespace x328 {

/**
 * @brief Range-checked [0, 999] parameter number, one addressable value on a node
 */
class ParameterNumber {
 public:
  static constexpr uint16_t kMax = 999;

  constexpr ParameterNumber() = default;

  /**
   * @brief Create a parameter number, checking that it is in [0, 999]
   * @return The parameter, or ErrorCode::kInvalidParameter
   */
  [[nodiscard]] static Result<ParameterNumber> Create(int value) {
    if (value < 0 || value > kMax) {
      return ErrorCode::kInvalidParameter;
    }
    return ParameterNumber{static_cast<uint16_t>(value)};
  }

  [[nodiscard]] constexpr uint16_t Value() const noexcept { return value_; }

  friend constexpr bool operator==(ParameterNumber const &lhs, ParameterNumber const &rhs) noexcept = default;
  friend constexpr bool operator<(ParameterNumber lhs, ParameterNumber rhs) noexcept {
    return lhs.value_ < rhs.value_;
  }

 private:
  constexpr explicit ParameterNumber(uint16_t value)
      : value_(value) {}

  uint16_t value_{0};
};

/**
 * @brief Signed parameter value as carried on the wire
 *
 * The wire field is a mandatory sign followed by 1 to 5 decimal digits, so the value range is
 * [-99999, 99999]. The decimal point is not transmitted; its position is fixed per parameter by
 * the application, see Scaled().
 */
class ParameterValue {
 public:
  static constexpr int32_t kMax = 99999;
  static constexpr int32_t kMin = -99999;
  static constexpr uint8_t kMaxDecimals = 5;

  constexpr ParameterValue() = default;

  /**
   * @brief Create a value, checking that it fits the wire field
   * @return The value, or ErrorCode::kValueOutOfRange
   */
  [[nodiscard]] static Result<ParameterValue> Create(int64_t value) {
    if (value < kMin || value > kMax) {
      return ErrorCode::kValueOutOfRange;
    }
    return ParameterValue{static_cast<int32_t>(value)};
  }

  [[nodiscard]] constexpr int32_t Value() const noexcept { return value_; }

  /**
   * @brief Interpret the value with an implied number of decimals, e.g. 1234 with 2 decimals is 12.34
   * @return The scaled reading, or ErrorCode::kValueOutOfRange if decimals > 5
   */
  [[nodiscard]] Result<double> Scaled(uint8_t decimals) const {
    if (decimals > kMaxDecimals) {
      return ErrorCode::kValueOutOfRange;
    }
    double scaled = value_;
    for (uint8_t i = 0; i < decimals; ++i) {
      scaled /= 10.0;
    }
    return scaled;
  }

  friend constexpr bool operator==(ParameterValue const &lhs, ParameterValue const &rhs) noexcept = default;

 private:
  constexpr explicit ParameterValue(int32_t value)
      : value_(value) {}

  int32_t value_{0};
};

}  // namespace x328
