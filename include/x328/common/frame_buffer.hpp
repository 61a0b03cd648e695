#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include "grammar.hpp"

namespace x328 {

/**
 * @brief Fixed-capacity byte buffer sized for the largest X3.28 frame
 *
 * Used as parser scratch space and as encoder output. Never allocates and never grows.
 */
class FrameBuffer {
 public:
  static constexpr size_t kCapacity = kMaxFrameSize;

  FrameBuffer() = default;

  /**
   * @brief Append a byte
   * @return false if the buffer is full (the byte is dropped)
   */
  bool PushBack(uint8_t byte) noexcept {
    if (size_ >= kCapacity) {
      return false;
    }
    data_[size_++] = byte;
    return true;
  }

  void Clear() noexcept { size_ = 0; }

  [[nodiscard]] size_t Size() const noexcept { return size_; }
  [[nodiscard]] bool Empty() const noexcept { return size_ == 0; }
  [[nodiscard]] bool Full() const noexcept { return size_ == kCapacity; }

  [[nodiscard]] std::span<uint8_t const> Bytes() const noexcept { return {data_.data(), size_}; }

  [[nodiscard]] uint8_t operator[](size_t index) const { return data_[index]; }

  [[nodiscard]] uint8_t const *begin() const noexcept { return data_.data(); }
  [[nodiscard]] uint8_t const *end() const noexcept { return data_.data() + size_; }

  friend bool operator==(FrameBuffer const &lhs, FrameBuffer const &rhs) noexcept {
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
  }

 private:
  std::array<uint8_t, kCapacity> data_{};
  size_t size_{0};
};

}  // namespace x328
