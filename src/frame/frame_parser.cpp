#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include "common/bcc.hpp"
#include "common/grammar.hpp"
#include "frame/frame_parser.hpp"

namespace x328 {

ParseResult FrameParser::Feed(std::span<uint8_t const> data) noexcept {
  size_t consumed = 0;
  while (consumed < data.size()) {
    Step step = Advance(data[consumed]);
    if (step.consumed) {
      ++consumed;
    }
    if (step.event.has_value()) {
      return {std::move(*step.event), consumed};
    }
  }
  return {NeedMoreData{}, consumed};
}

void FrameParser::Reset() noexcept {
  phase_ = ParserPhase::kIdle;
  body_.Clear();
  address_.reset();
  digit_count_ = 0;
  address_accumulator_ = 0;
  parameter_ = 0;
  value_magnitude_ = 0;
  value_negative_ = false;
  has_value_ = false;
  is_response_ = false;
}

FrameParser::Step FrameParser::Advance(uint8_t byte) noexcept {
  switch (phase_) {
    case ParserPhase::kIdle:
      return BeginFrame(byte);
    case ParserPhase::kExpectingAddress:
      return OnAddressDigit(byte);
    case ParserPhase::kExpectingParameter:
      return OnParameterDigit(byte);
    case ParserPhase::kExpectingValueOrTerminator:
      return OnValueOrTerminator(byte);
    case ParserPhase::kExpectingValueDigits:
      return OnValueDigit(byte);
    case ParserPhase::kAwaitingChecksum:
      return OnChecksum(byte);
    case ParserPhase::kExpectingSelectAddress:
      return OnSelectAddressDigit(byte);
    case ParserPhase::kExpectingSelectTerminator:
      return OnSelectTerminator(byte);
    case ParserPhase::kDiscardingFrame:
      return OnDiscardedByte(byte);
    case ParserPhase::kDiscardingChecksum:
      phase_ = ParserPhase::kIdle;
      return {};
  }
  return {};
}

FrameParser::Step FrameParser::BeginFrame(uint8_t byte) noexcept {
  switch (byte) {
    case kStx:
      Reset();
      phase_ = ParserPhase::kExpectingAddress;
      return {};
    case kEot:
      if (role_ == ParserRole::kResponse) {
        return {Frame{Nak{NakReason::kInvalidParameter}}};
      }
      Reset();
      phase_ = ParserPhase::kExpectingSelectAddress;
      return {};
    case kAck:
      return {Frame{WriteAck{}}};
    case kNak:
      return {Frame{Nak{NakReason::kCommandFailed}}};
    default:
      // Noise between frames
      return {};
  }
}

FrameParser::Step FrameParser::OnAddressDigit(uint8_t byte) noexcept {
  // A sign straight after STX can only be a read response
  if (digit_count_ == 0 && IsSignByte(byte)) {
    if (!Append(byte)) {
      return Fail(byte, ErrorCode::kBufferOverflow);
    }
    is_response_ = true;
    value_negative_ = byte == kMinusSign;
    phase_ = ParserPhase::kExpectingValueDigits;
    return {};
  }

  auto const digit = ByteToDigit(byte);
  if (!digit) {
    return Reject(byte);
  }
  if (!Append(byte)) {
    return Fail(byte, ErrorCode::kBufferOverflow);
  }

  address_accumulator_ = static_cast<uint8_t>(address_accumulator_ * 10 + digit.Value());
  if (++digit_count_ == kAddressDigits) {
    address_ = StationAddress::Create(address_accumulator_).Value();
    digit_count_ = 0;
    phase_ = ParserPhase::kExpectingParameter;
  }
  return {};
}

FrameParser::Step FrameParser::OnParameterDigit(uint8_t byte) noexcept {
  auto const digit = ByteToDigit(byte);
  if (!digit) {
    return Reject(byte);
  }
  if (!Append(byte)) {
    return Fail(byte, ErrorCode::kBufferOverflow);
  }

  parameter_ = static_cast<uint16_t>(parameter_ * 10 + digit.Value());
  if (++digit_count_ == kParameterDigits) {
    digit_count_ = 0;
    phase_ = ParserPhase::kExpectingValueOrTerminator;
  }
  return {};
}

FrameParser::Step FrameParser::OnValueOrTerminator(uint8_t byte) noexcept {
  if (byte == kEtx) {
    if (!Append(byte)) {
      return Fail(byte, ErrorCode::kBufferOverflow);
    }
    phase_ = ParserPhase::kAwaitingChecksum;
    return {};
  }
  if (IsSignByte(byte)) {
    if (!Append(byte)) {
      return Fail(byte, ErrorCode::kBufferOverflow);
    }
    has_value_ = true;
    value_negative_ = byte == kMinusSign;
    phase_ = ParserPhase::kExpectingValueDigits;
    return {};
  }
  return Reject(byte);
}

FrameParser::Step FrameParser::OnValueDigit(uint8_t byte) noexcept {
  if (byte == kEtx) {
    if (digit_count_ == 0) {
      // Sign without digits
      return Fail(byte, ErrorCode::kFramingError);
    }
    if (!Append(byte)) {
      return Fail(byte, ErrorCode::kBufferOverflow);
    }
    phase_ = ParserPhase::kAwaitingChecksum;
    return {};
  }

  auto const digit = ByteToDigit(byte);
  if (!digit) {
    return Reject(byte);
  }
  if (digit_count_ == kValueMaxDigits || !Append(byte)) {
    return Fail(byte, ErrorCode::kBufferOverflow);
  }

  value_magnitude_ = value_magnitude_ * 10 + digit.Value();
  ++digit_count_;
  return {};
}

FrameParser::Step FrameParser::OnChecksum(uint8_t byte) noexcept {
  if (!VerifyBcc(body_.Bytes(), byte, options_.bcc_mode)) {
    return Fail(byte, ErrorCode::kChecksumError);
  }

  auto const value = ParameterValue::Create(value_negative_ ? -value_magnitude_ : value_magnitude_);
  if (!value) {
    return Fail(byte, value.Error());
  }

  if (is_response_) {
    return Complete(ReadResponse{value.Value()});
  }

  auto const parameter = ParameterNumber::Create(parameter_).Value();
  if (has_value_) {
    return Complete(WriteRequest{*address_, parameter, value.Value()});
  }
  return Complete(ReadRequest{*address_, parameter});
}

FrameParser::Step FrameParser::OnSelectAddressDigit(uint8_t byte) noexcept {
  auto const digit = ByteToDigit(byte);
  if (!digit) {
    if (digit_count_ == 0) {
      // Lone EOT: end of transmission, not a select sequence. The byte is handled as if idle.
      Reset();
      return BeginFrame(byte);
    }
    return Reject(byte);
  }

  address_accumulator_ = static_cast<uint8_t>(address_accumulator_ * 10 + digit.Value());
  if (++digit_count_ == kAddressDigits) {
    address_ = StationAddress::Create(address_accumulator_).Value();
    digit_count_ = 0;
    phase_ = ParserPhase::kExpectingSelectTerminator;
  }
  return {};
}

FrameParser::Step FrameParser::OnSelectTerminator(uint8_t byte) noexcept {
  if (byte != kEnq) {
    return Reject(byte);
  }
  return Complete(SelectSequence{*address_});
}

FrameParser::Step FrameParser::OnDiscardedByte(uint8_t byte) noexcept {
  if (StartsFrame(byte)) {
    Reset();
    return BeginFrame(byte);
  }
  if (byte == kEtx) {
    phase_ = ParserPhase::kDiscardingChecksum;
  }
  return {};
}

FrameParser::Step FrameParser::Reject(uint8_t byte) noexcept {
  return Fail(byte, IsControlByte(byte) ? ErrorCode::kFramingError : ErrorCode::kInvalidDigit);
}

FrameParser::Step FrameParser::Fail(uint8_t byte, ErrorCode code) noexcept {
  ParseError error{code, address_};
  bool const in_body = phase_ == ParserPhase::kExpectingAddress || phase_ == ParserPhase::kExpectingParameter ||
                       phase_ == ParserPhase::kExpectingValueOrTerminator ||
                       phase_ == ParserPhase::kExpectingValueDigits;
  Reset();
  // A byte that starts a new frame is left for the next call
  if (StartsFrame(byte)) {
    return {ParseEvent{error}, false};
  }
  if (in_body) {
    phase_ = byte == kEtx ? ParserPhase::kDiscardingChecksum : ParserPhase::kDiscardingFrame;
  }
  return {ParseEvent{error}};
}

FrameParser::Step FrameParser::Complete(Frame const &frame) noexcept {
  Reset();
  return {ParseEvent{frame}};
}

bool FrameParser::StartsFrame(uint8_t byte) const noexcept {
  return byte == kStx || byte == kEot;
}

bool FrameParser::Append(uint8_t byte) noexcept {
  return body_.PushBack(byte);
}

}  // namespace x328
