#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>
#include "frame/frame_encoder.hpp"
#include "slave/slave.hpp"

namespace x328 {

Result<SlaveFeedResult> Slave::Feed(std::span<uint8_t const> data) {
  if (HasPendingRequest()) {
    return ErrorCode::kSequenceError;
  }
  nak_allowed_ = false;

  size_t consumed = 0;
  while (consumed < data.size()) {
    ParseResult const result = parser_.Feed(data.subspan(consumed));
    consumed += result.consumed;

    if (auto const *frame = std::get_if<Frame>(&result.event)) {
      if (!IsForThisStation(*frame)) {
        continue;
      }
      if (auto const *read = std::get_if<ReadRequest>(frame)) {
        pending_ = PendingKind::kRead;
        return SlaveFeedResult{ParameterReadRequested{read->parameter}, consumed};
      }
      if (auto const *write = std::get_if<WriteRequest>(frame)) {
        pending_ = PendingKind::kWrite;
        return SlaveFeedResult{ParameterWriteRequested{write->parameter, write->value}, consumed};
      }
      pending_ = PendingKind::kSelect;
      return SlaveFeedResult{StationSelected{}, consumed};
    }

    if (auto const *error = std::get_if<ParseError>(&result.event)) {
      if (error->address == address_) {
        nak_allowed_ = true;
        return SlaveFeedResult{ProtocolError{error->code}, consumed};
      }
      continue;
    }

    break;  // NeedMoreData: everything was consumed
  }
  return SlaveFeedResult{NeedMoreData{}, consumed};
}

Result<FrameBuffer> Slave::RespondValue(ParameterValue value) {
  if (pending_ != PendingKind::kRead) {
    return ErrorCode::kSequenceError;
  }
  return Answer(ReadResponse{value});
}

Result<FrameBuffer> Slave::RespondValue(int64_t value) {
  if (pending_ != PendingKind::kRead) {
    return ErrorCode::kSequenceError;
  }
  auto const checked = ParameterValue::Create(value);
  if (!checked) {
    return checked.Error();
  }
  return RespondValue(checked.Value());
}

Result<FrameBuffer> Slave::Acknowledge() {
  if (pending_ != PendingKind::kWrite && pending_ != PendingKind::kSelect) {
    return ErrorCode::kSequenceError;
  }
  return Answer(WriteAck{});
}

Result<FrameBuffer> Slave::RespondNak(NakReason reason) {
  if (!HasPendingRequest() && !nak_allowed_) {
    return ErrorCode::kSequenceError;
  }
  return Answer(Nak{reason});
}

void Slave::Reset() noexcept {
  parser_.Reset();
  pending_ = PendingKind::kNone;
  nak_allowed_ = false;
}

SlaveState Slave::GetState() const noexcept {
  if (HasPendingRequest()) {
    return SlaveState::kDispatching;
  }
  switch (parser_.GetPhase()) {
    case ParserPhase::kIdle:
    case ParserPhase::kDiscardingFrame:
    case ParserPhase::kDiscardingChecksum:
      return SlaveState::kIdle;
    default:
      break;
  }
  return parser_.GetAddress().has_value() ? SlaveState::kParsingCommand : SlaveState::kMatchingAddress;
}

void Slave::SetAddress(StationAddress address) noexcept {
  address_ = address;
  Reset();
}

bool Slave::IsForThisStation(Frame const &frame) const noexcept {
  if (auto const *read = std::get_if<ReadRequest>(&frame)) {
    return read->address == address_;
  }
  if (auto const *write = std::get_if<WriteRequest>(&frame)) {
    return write->address == address_;
  }
  if (auto const *select = std::get_if<SelectSequence>(&frame)) {
    return select->address == address_;
  }
  // Answers from other nodes
  return false;
}

FrameBuffer Slave::Answer(Frame const &frame) {
  pending_ = PendingKind::kNone;
  nak_allowed_ = false;
  return FrameEncoder::Encode(frame, options_);
}

}  // namespace x328
