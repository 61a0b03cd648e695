#pragma once

#include <cstdint>

namespace x328 {

/**
 * @brief How the block check character is finalized after XOR accumulation.
 */
enum class BccMode : uint8_t {
  /** Plain XOR of the body bytes */
  kPlain,
  /** XOR, with 0x20 added when the result is below 0x20 so the BCC is never a control byte */
  kPrintable
};

/**
 * @brief Wire format options shared by parser, encoder and the state machines.
 */
struct WireFormatOptions {
  BccMode bcc_mode{BccMode::kPlain};
};

}  // namespace x328
