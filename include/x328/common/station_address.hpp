#pragma once

#include <cstdint>
#include "result.hpp"

namespace x328 {

/**
 * @brief Range-checked [0, 99] station address of one node on the bus
 */
class StationAddress {
 public:
  static constexpr uint8_t kMax = 99;

  constexpr StationAddress() = default;

  /**
   * @brief Create an address, checking that it is in [0, 99]
   * @return The address, or ErrorCode::kInvalidAddress
   */
  [[nodiscard]] static Result<StationAddress> Create(int value) {
    if (value < 0 || value > kMax) {
      return ErrorCode::kInvalidAddress;
    }
    return StationAddress{static_cast<uint8_t>(value)};
  }

  [[nodiscard]] constexpr uint8_t Value() const noexcept { return value_; }

  friend constexpr bool operator==(StationAddress const &lhs, StationAddress const &rhs) noexcept = default;

 private:
  constexpr explicit StationAddress(uint8_t value)
      : value_(value) {}

  uint8_t value_{0};
};

}  // namespace x328
