#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include "../common/error_code.hpp"
#include "../common/frame_buffer.hpp"
#include "../common/station_address.hpp"
#include "../common/wire_format_options.hpp"
#include "frame.hpp"

namespace x328 {

/**
 * @brief Which side of the bus the parser listens to
 */
enum class ParserRole : uint8_t {
  /** Node side: EOT starts a select sequence, a lone EOT is an end of transmission */
  kCommand,
  /** Master side: a lone EOT is a reply meaning "invalid parameter" */
  kResponse
};

enum class ParserPhase : uint8_t {
  kIdle,
  kExpectingAddress,
  kExpectingParameter,
  kExpectingValueOrTerminator,
  kExpectingValueDigits,
  kAwaitingChecksum,
  kExpectingSelectAddress,
  kExpectingSelectTerminator,
  /** Skipping the rest of a broken frame up to its ETX */
  kDiscardingFrame,
  /** Skipping the BCC that follows the ETX of a broken frame */
  kDiscardingChecksum
};

/** More bytes are needed to complete the current frame */
struct NeedMoreData {
  friend bool operator==(NeedMoreData const &, NeedMoreData const &) = default;
};

/**
 * @brief A structural error; the partial frame has been discarded
 */
struct ParseError {
  ErrorCode code{ErrorCode::kFramingError};
  /** Address field of the rejected frame, when it was parsed before the error */
  std::optional<StationAddress> address{};

  friend bool operator==(ParseError const &, ParseError const &) = default;
};

/**
 * @brief A state machine received a frame it cannot accept: malformed, failing its BCC, or not
 * fitting the current exchange
 */
struct ProtocolError {
  ErrorCode code{ErrorCode::kFramingError};

  friend bool operator==(ProtocolError const &, ProtocolError const &) = default;
};

using ParseEvent = std::variant<NeedMoreData, Frame, ParseError>;

struct ParseResult {
  ParseEvent event;
  /** Bytes of the input taken by this call; the rest must be fed again */
  size_t consumed{0};
};

/**
 * @brief Incremental, self-resynchronizing X3.28 frame parser
 *
 * Feed() accepts any chunk of bytes, from a single byte upwards, and stops at the first completed
 * frame or error. Bytes between frames are skipped. On any error the partial frame is dropped.
 * An STX or EOT that causes the error is left unconsumed so the next call starts a fresh frame with
 * it. After an error inside an STX frame the remaining bytes of that frame, through its ETX and BCC,
 * are skipped; an STX or EOT ends the skipping early. A corrupted frame followed by a good one
 * therefore yields exactly one ParseError and then the good Frame.
 *
 * The parser holds only its phase, a few counters and a FrameBuffer; it never allocates.
 */
class FrameParser {
 public:
  explicit FrameParser(ParserRole role, WireFormatOptions options = {})
      : role_(role),
        options_(options) {}

  /**
   * @brief Advance the parser over data
   * @param data Received bytes
   * @return NeedMoreData (all bytes consumed), a Frame or a ParseError, plus the consumed count
   */
  [[nodiscard]] ParseResult Feed(std::span<uint8_t const> data) noexcept;

  /**
   * @brief Drop any partial frame and return to kIdle
   */
  void Reset() noexcept;

  [[nodiscard]] ParserRole GetRole() const noexcept { return role_; }
  [[nodiscard]] ParserPhase GetPhase() const noexcept { return phase_; }

  /**
   * @brief Address field of the frame being parsed, once both digits have arrived
   */
  [[nodiscard]] std::optional<StationAddress> GetAddress() const noexcept { return address_; }

 private:
  struct Step {
    std::optional<ParseEvent> event{};
    bool consumed{true};
  };

  Step Advance(uint8_t byte) noexcept;
  Step BeginFrame(uint8_t byte) noexcept;
  Step OnAddressDigit(uint8_t byte) noexcept;
  Step OnParameterDigit(uint8_t byte) noexcept;
  Step OnValueOrTerminator(uint8_t byte) noexcept;
  Step OnValueDigit(uint8_t byte) noexcept;
  Step OnChecksum(uint8_t byte) noexcept;
  Step OnSelectAddressDigit(uint8_t byte) noexcept;
  Step OnSelectTerminator(uint8_t byte) noexcept;
  Step OnDiscardedByte(uint8_t byte) noexcept;

  /** Reject byte: kFramingError for control bytes, kInvalidDigit for anything else */
  Step Reject(uint8_t byte) noexcept;
  Step Fail(uint8_t byte, ErrorCode code) noexcept;
  Step Complete(Frame const &frame) noexcept;

  [[nodiscard]] bool StartsFrame(uint8_t byte) const noexcept;
  bool Append(uint8_t byte) noexcept;

  ParserRole role_;
  WireFormatOptions options_;
  ParserPhase phase_{ParserPhase::kIdle};
  FrameBuffer body_{};  // bytes after STX, through ETX
  std::optional<StationAddress> address_{};
  uint8_t digit_count_{0};
  uint8_t address_accumulator_{0};
  uint16_t parameter_{0};
  int32_t value_magnitude_{0};
  bool value_negative_{false};
  bool has_value_{false};
  bool is_response_{false};
};

}  // namespace x328
