#pragma once

#include <cstddef>
#include <cstdint>
#include "result.hpp"

namespace x328 {

// Control bytes
static constexpr uint8_t kStx = 0x02;  // start of a checksummed frame body
static constexpr uint8_t kEtx = 0x03;  // end of text, followed by the BCC
static constexpr uint8_t kEot = 0x04;  // starts a select sequence; "invalid parameter" in reply position
static constexpr uint8_t kEnq = 0x05;  // terminates a select sequence
static constexpr uint8_t kAck = 0x06;
static constexpr uint8_t kNak = 0x15;

static constexpr uint8_t kPlusSign = '+';
static constexpr uint8_t kMinusSign = '-';

// Field widths
static constexpr size_t kAddressDigits = 2;
static constexpr size_t kParameterDigits = 3;
static constexpr size_t kValueMaxDigits = 5;
static constexpr size_t kValueFieldWidth = 1 + kValueMaxDigits;  // sign + digits

// STX + address + parameter + value + ETX + BCC
static constexpr size_t kMaxFrameSize = 1 + kAddressDigits + kParameterDigits + kValueFieldWidth + 1 + 1;

// EOT + address + ENQ
static constexpr size_t kSelectSequenceSize = 1 + kAddressDigits + 1;

[[nodiscard]] static inline constexpr bool IsDigitByte(uint8_t byte) {
  return byte >= '0' && byte <= '9';
}

[[nodiscard]] static inline constexpr bool IsSignByte(uint8_t byte) {
  return byte == kPlusSign || byte == kMinusSign;
}

[[nodiscard]] static inline constexpr bool IsControlByte(uint8_t byte) {
  return byte == kStx || byte == kEtx || byte == kEot || byte == kEnq || byte == kAck || byte == kNak;
}

/**
 * @brief Convert a digit 0..9 to its ASCII byte
 */
[[nodiscard]] static inline constexpr uint8_t DigitToByte(uint8_t digit) {
  return static_cast<uint8_t>('0' + digit % 10);
}

/**
 * @brief Convert an ASCII decimal digit byte to its numeric value
 * @return The digit, or ErrorCode::kInvalidDigit
 */
[[nodiscard]] static inline Result<uint8_t> ByteToDigit(uint8_t byte) {
  if (!IsDigitByte(byte)) {
    return ErrorCode::kInvalidDigit;
  }
  return static_cast<uint8_t>(byte - '0');
}

}  // namespace x328
