#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include "../common/frame_buffer.hpp"
#include "../common/result.hpp"
#include "../common/wire_format_options.hpp"
#include "frame.hpp"

namespace x328 {

/**
 * @brief X3.28 frame encoder
 *
 * Wire forms produced:
 *  - ReadRequest:    STX a a p p p ETX BCC
 *  - WriteRequest:   STX a a p p p s d{1,5} ETX BCC
 *  - ReadResponse:   STX s d{1,5} ETX BCC
 *  - WriteAck:       ACK
 *  - Nak:            NAK (command failed) or EOT (invalid parameter)
 *  - SelectSequence: EOT a a ENQ
 *
 * The BCC is always computed here, from the body bytes after STX through ETX.
 */
class FrameEncoder {
 public:
  /**
   * @brief Encode a frame into a fixed-capacity buffer
   * @param frame The frame to encode
   * @param options Wire format options (BCC mode)
   * @return Encoded bytes; every frame fits, so this cannot fail
   */
  [[nodiscard]] static FrameBuffer Encode(Frame const &frame, WireFormatOptions options = {});

  /**
   * @brief Encode a frame into a caller-supplied buffer
   * @param frame The frame to encode
   * @param out Destination, must hold at least kMaxFrameSize bytes
   * @param options Wire format options (BCC mode)
   * @return Number of bytes written, or ErrorCode::kBufferOverflow if out is smaller than kMaxFrameSize
   */
  [[nodiscard]] static Result<size_t> Encode(Frame const &frame, std::span<uint8_t> out,
                                             WireFormatOptions options = {});

  /**
   * @brief Append the sign and minimal decimal digits of a value, e.g. 56 -> "+56", -7 -> "-7"
   */
  static void AppendValue(ParameterValue value, FrameBuffer &buffer);
};

}  // namespace x328
