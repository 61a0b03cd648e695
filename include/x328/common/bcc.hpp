#pragma once

#include <cstdint>
#include <span>
#include "wire_format_options.hpp"

namespace x328 {

static constexpr uint8_t kBccPrintableOffset = 0x20;

/**
 * @brief Calculate the X3.28 block check character
 *
 * The BCC is the XOR of every byte of the frame body: the byte after STX through ETX inclusive.
 * With BccMode::kPrintable a result below 0x20 is moved up by 0x20.
 *
 * XOR accumulation detects every single-byte corruption of the body. It does not detect all
 * multi-byte corruptions: flipping the same bit in two different bytes leaves the BCC unchanged.
 * kPrintable folds [0x00, 0x1F] onto [0x20, 0x3F] and so loses the single-byte guarantee.
 *
 * @param body Frame body (after STX, through ETX)
 * @param mode Finalization mode
 * @return BCC byte
 */
[[nodiscard]] inline uint8_t CalculateBcc(std::span<uint8_t const> body, BccMode mode = BccMode::kPlain) {
  uint8_t bcc = 0;
  for (uint8_t byte : body) {
    bcc ^= byte;
  }
  if (mode == BccMode::kPrintable && bcc < kBccPrintableOffset) {
    bcc = static_cast<uint8_t>(bcc + kBccPrintableOffset);
  }
  return bcc;
}

/**
 * @brief Verify a received BCC against a frame body
 *
 * @param body Frame body (after STX, through ETX)
 * @param received_bcc The BCC byte that followed ETX on the wire
 * @param mode Finalization mode
 * @return true if the BCC matches
 */
[[nodiscard]] inline bool VerifyBcc(std::span<uint8_t const> body, uint8_t received_bcc,
                                    BccMode mode = BccMode::kPlain) {
  return CalculateBcc(body, mode) == received_bcc;
}

}  // namespace x328
