#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>
#include "common/bcc.hpp"
#include "common/frame_buffer.hpp"
#include "common/grammar.hpp"
#include "frame/frame.hpp"
#include "frame/frame_encoder.hpp"

namespace x328 {

namespace {

void AppendAddress(StationAddress address, FrameBuffer &buffer) {
  buffer.PushBack(DigitToByte(address.Value() / 10));
  buffer.PushBack(DigitToByte(address.Value() % 10));
}

void AppendParameter(ParameterNumber parameter, FrameBuffer &buffer) {
  uint16_t const value = parameter.Value();
  buffer.PushBack(DigitToByte(static_cast<uint8_t>(value / 100)));
  buffer.PushBack(DigitToByte(static_cast<uint8_t>((value / 10) % 10)));
  buffer.PushBack(DigitToByte(static_cast<uint8_t>(value % 10)));
}

// Closes a checksummed frame: ETX, then the BCC over everything after the leading STX.
void AppendEtxBcc(FrameBuffer &buffer, BccMode mode) {
  buffer.PushBack(kEtx);
  buffer.PushBack(CalculateBcc(buffer.Bytes().subspan(1), mode));
}

}  // namespace

void FrameEncoder::AppendValue(ParameterValue value, FrameBuffer &buffer) {
  int32_t const raw = value.Value();
  buffer.PushBack(raw < 0 ? kMinusSign : kPlusSign);

  uint32_t magnitude = static_cast<uint32_t>(raw < 0 ? -raw : raw);
  std::array<uint8_t, kValueMaxDigits> digits{};
  size_t count = 0;
  do {
    digits[count++] = DigitToByte(static_cast<uint8_t>(magnitude % 10));
    magnitude /= 10;
  } while (magnitude != 0 && count < digits.size());

  while (count > 0) {
    buffer.PushBack(digits[--count]);
  }
}

FrameBuffer FrameEncoder::Encode(Frame const &frame, WireFormatOptions options) {
  FrameBuffer buffer;

  if (auto const *read = std::get_if<ReadRequest>(&frame)) {
    buffer.PushBack(kStx);
    AppendAddress(read->address, buffer);
    AppendParameter(read->parameter, buffer);
    AppendEtxBcc(buffer, options.bcc_mode);
  } else if (auto const *write = std::get_if<WriteRequest>(&frame)) {
    buffer.PushBack(kStx);
    AppendAddress(write->address, buffer);
    AppendParameter(write->parameter, buffer);
    AppendValue(write->value, buffer);
    AppendEtxBcc(buffer, options.bcc_mode);
  } else if (auto const *response = std::get_if<ReadResponse>(&frame)) {
    buffer.PushBack(kStx);
    AppendValue(response->value, buffer);
    AppendEtxBcc(buffer, options.bcc_mode);
  } else if (std::holds_alternative<WriteAck>(frame)) {
    buffer.PushBack(kAck);
  } else if (auto const *nak = std::get_if<Nak>(&frame)) {
    buffer.PushBack(nak->reason == NakReason::kInvalidParameter ? kEot : kNak);
  } else if (auto const *select = std::get_if<SelectSequence>(&frame)) {
    buffer.PushBack(kEot);
    AppendAddress(select->address, buffer);
    buffer.PushBack(kEnq);
  }

  return buffer;
}

Result<size_t> FrameEncoder::Encode(Frame const &frame, std::span<uint8_t> out, WireFormatOptions options) {
  if (out.size() < kMaxFrameSize) {
    return ErrorCode::kBufferOverflow;
  }

  FrameBuffer const buffer = Encode(frame, options);
  std::copy(buffer.begin(), buffer.end(), out.begin());
  return buffer.Size();
}

}  // namespace x328
