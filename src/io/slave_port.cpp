#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "io/slave_port.hpp"

namespace x328 {

namespace {

constexpr size_t kReadChunkSize = 128;

NakReason NakReasonFor(ErrorCode error) {
  return error == ErrorCode::kInvalidParameter ? NakReason::kInvalidParameter : NakReason::kCommandFailed;
}

}  // namespace

Result<size_t> SlavePort::Poll(ByteTransport &transport) {
  uint8_t temp[kReadChunkSize];
  while (true) {
    int n = transport.Read(std::span<uint8_t>(temp, sizeof(temp)));
    if (n < 0) {
      spdlog::warn("x328 station {}: transport read failed", slave_.GetAddress().Value());
      return ErrorCode::kTransportError;
    }
    if (n == 0) {
      break;
    }
    spdlog::trace("x328 rx: {:02x}", fmt::join(std::span<uint8_t const>(temp, static_cast<size_t>(n)), " "));
    received_.insert(received_.end(), temp, temp + n);
  }

  size_t answered = 0;
  while (!received_.empty()) {
    auto fed = slave_.Feed(received_);
    if (!fed) {
      return fed.Error();
    }
    received_.erase(received_.begin(), received_.begin() + static_cast<std::ptrdiff_t>(fed.Value().consumed));

    SlaveEvent const &event = fed.Value().event;
    if (std::holds_alternative<NeedMoreData>(event)) {
      break;
    }

    auto answer = Dispatch(event);
    if (!answer) {
      return answer.Error();
    }
    auto sent = Transmit(answer.Value(), transport);
    if (!sent) {
      return sent.Error();
    }
    ++answered;
  }
  return answered;
}

void SlavePort::SetAddress(StationAddress address) {
  slave_.SetAddress(address);
  received_.clear();
}

Result<FrameBuffer> SlavePort::Dispatch(SlaveEvent const &event) {
  uint8_t const station = slave_.GetAddress().Value();

  if (auto const *read = std::get_if<ParameterReadRequested>(&event)) {
    auto value = handler_.OnRead(read->parameter);
    if (!value) {
      spdlog::debug("x328 station {}: read {:03d} rejected: {}", station, read->parameter.Value(),
                    ToString(value.Error()));
      return slave_.RespondNak(NakReasonFor(value.Error()));
    }
    spdlog::debug("x328 station {}: read {:03d} = {}", station, read->parameter.Value(), value.Value().Value());
    return slave_.RespondValue(value.Value());
  }

  if (auto const *write = std::get_if<ParameterWriteRequested>(&event)) {
    auto result = handler_.OnWrite(write->parameter, write->value);
    if (!result) {
      spdlog::debug("x328 station {}: write {:03d} rejected: {}", station, write->parameter.Value(),
                    ToString(result.Error()));
      return slave_.RespondNak(NakReasonFor(result.Error()));
    }
    spdlog::debug("x328 station {}: write {:03d} = {}", station, write->parameter.Value(), write->value.Value());
    return slave_.Acknowledge();
  }

  if (std::holds_alternative<StationSelected>(event)) {
    if (!handler_.OnSelect()) {
      return slave_.RespondNak();
    }
    return slave_.Acknowledge();
  }

  auto const &error = std::get<ProtocolError>(event);
  spdlog::debug("x328 station {}: malformed request: {}", station, ToString(error.code));
  return slave_.RespondNak();
}

Result<void> SlavePort::Transmit(FrameBuffer const &answer, ByteTransport &transport) {
  spdlog::trace("x328 tx: {:02x}", fmt::join(answer.Bytes(), " "));
  if (transport.Write(answer.Bytes()) != static_cast<int>(answer.Size()) || !transport.Flush()) {
    spdlog::warn("x328 station {}: transport write failed", slave_.GetAddress().Value());
    return ErrorCode::kTransportError;
  }
  return {};
}

}  // namespace x328
