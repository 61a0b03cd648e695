#include <cstdint>
#include <span>
#include <variant>
#include "frame/frame_encoder.hpp"
#include "master/master.hpp"

namespace x328 {

Result<FrameBuffer> Master::StartRead(StationAddress address, ParameterNumber parameter) {
  return Arm(ReadRequest{address, parameter}, PendingKind::kRead, MasterState::kAwaitingResponse);
}

Result<FrameBuffer> Master::StartRead(int address, int parameter) {
  if (!IsIdle()) {
    return ErrorCode::kSequenceError;
  }
  auto const station = StationAddress::Create(address);
  if (!station) {
    return station.Error();
  }
  auto const number = ParameterNumber::Create(parameter);
  if (!number) {
    return number.Error();
  }
  return StartRead(station.Value(), number.Value());
}

Result<FrameBuffer> Master::StartWrite(StationAddress address, ParameterNumber parameter, ParameterValue value) {
  return Arm(WriteRequest{address, parameter, value}, PendingKind::kWrite, MasterState::kAwaitingResponse);
}

Result<FrameBuffer> Master::StartWrite(int address, int parameter, int64_t value) {
  if (!IsIdle()) {
    return ErrorCode::kSequenceError;
  }
  auto const station = StationAddress::Create(address);
  if (!station) {
    return station.Error();
  }
  auto const number = ParameterNumber::Create(parameter);
  if (!number) {
    return number.Error();
  }
  auto const checked = ParameterValue::Create(value);
  if (!checked) {
    return checked.Error();
  }
  return StartWrite(station.Value(), number.Value(), checked.Value());
}

Result<FrameBuffer> Master::StartSelect(StationAddress address) {
  return Arm(SelectSequence{address}, PendingKind::kSelect, MasterState::kAwaitingSelectAck);
}

Result<FrameBuffer> Master::StartSelect(int address) {
  if (!IsIdle()) {
    return ErrorCode::kSequenceError;
  }
  auto const station = StationAddress::Create(address);
  if (!station) {
    return station.Error();
  }
  return StartSelect(station.Value());
}

Result<MasterEvent> Master::Feed(std::span<uint8_t const> data) {
  if (IsIdle()) {
    return ErrorCode::kSequenceError;
  }

  ParseResult const result = parser_.Feed(data);
  if (auto const *frame = std::get_if<Frame>(&result.event)) {
    return OnFrame(*frame);
  }
  if (auto const *error = std::get_if<ParseError>(&result.event)) {
    return Finish(ProtocolError{error->code}, MasterOutcome::kProtocolError);
  }
  return MasterEvent{NeedMoreData{}};
}

bool Master::NotifyTimeout() noexcept {
  if (IsIdle()) {
    return false;
  }
  Finish(NeedMoreData{}, MasterOutcome::kTimedOut);
  return true;
}

void Master::Reset() noexcept {
  parser_.Reset();
  state_ = MasterState::kIdle;
}

Result<FrameBuffer> Master::Arm(Frame const &request, PendingKind kind, MasterState state) {
  if (!IsIdle()) {
    return ErrorCode::kSequenceError;
  }
  parser_.Reset();
  pending_ = kind;
  state_ = state;
  return FrameEncoder::Encode(request, options_);
}

MasterEvent Master::Finish(MasterEvent event, MasterOutcome outcome) noexcept {
  parser_.Reset();
  state_ = MasterState::kIdle;
  last_outcome_ = outcome;
  return event;
}

MasterEvent Master::OnFrame(Frame const &frame) noexcept {
  if (auto const *nak = std::get_if<Nak>(&frame)) {
    return Finish(Nakd{nak->reason}, MasterOutcome::kNakd);
  }

  switch (pending_) {
    case PendingKind::kRead:
      if (auto const *response = std::get_if<ReadResponse>(&frame)) {
        return Finish(ReadCompleted{response->value}, MasterOutcome::kCompleted);
      }
      break;
    case PendingKind::kWrite:
      if (std::holds_alternative<WriteAck>(frame)) {
        return Finish(WriteAcked{}, MasterOutcome::kCompleted);
      }
      break;
    case PendingKind::kSelect:
      if (std::holds_alternative<WriteAck>(frame)) {
        return Finish(SelectAcked{}, MasterOutcome::kCompleted);
      }
      break;
  }

  // A well-formed frame that does not answer the outstanding request
  return Finish(ProtocolError{ErrorCode::kFramingError}, MasterOutcome::kProtocolError);
}

}  // namespace x328
