#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <thread>
#include <variant>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "io/blocking_master.hpp"

namespace x328 {

namespace {

constexpr size_t kReadChunkSize = 128;

}  // namespace

Result<ParameterValue> BlockingMaster::ReadParameter(int address, int parameter) {
  auto const event = Transact(master_.StartRead(address, parameter));
  if (!event) {
    return event.Error();
  }
  if (auto const *completed = std::get_if<ReadCompleted>(&event.Value())) {
    spdlog::debug("x328: read {:02d}/{:03d} = {}", address, parameter, completed->value.Value());
    return completed->value;
  }
  return FailureOf(event.Value());
}

Result<void> BlockingMaster::WriteParameter(int address, int parameter, int64_t value) {
  auto const event = Transact(master_.StartWrite(address, parameter, value));
  if (!event) {
    return event.Error();
  }
  if (std::holds_alternative<WriteAcked>(event.Value())) {
    spdlog::debug("x328: wrote {:02d}/{:03d} = {}", address, parameter, value);
    return {};
  }
  return FailureOf(event.Value());
}

Result<void> BlockingMaster::Select(int address) {
  auto const event = Transact(master_.StartSelect(address));
  if (!event) {
    return event.Error();
  }
  if (std::holds_alternative<SelectAcked>(event.Value())) {
    return {};
  }
  return FailureOf(event.Value());
}

Result<MasterEvent> BlockingMaster::Transact(Result<FrameBuffer> const &request) {
  last_nak_.reset();
  if (!request) {
    return request.Error();
  }

  auto const bytes = request.Value().Bytes();
  spdlog::trace("x328 tx: {:02x}", fmt::join(bytes, " "));
  if (transport_.Write(bytes) != static_cast<int>(bytes.size()) || !transport_.Flush()) {
    spdlog::warn("x328: transport write failed");
    master_.Reset();
    return ErrorCode::kTransportError;
  }
  return AwaitAnswer();
}

Result<MasterEvent> BlockingMaster::AwaitAnswer() {
  auto const deadline = std::chrono::steady_clock::now() + timeout_;

  while (true) {
    uint8_t temp[kReadChunkSize];
    int n = transport_.Read(std::span<uint8_t>(temp, sizeof(temp)));
    if (n < 0) {
      spdlog::warn("x328: transport read failed");
      master_.Reset();
      return ErrorCode::kTransportError;
    }
    if (n > 0) {
      std::span<uint8_t const> received(temp, static_cast<size_t>(n));
      spdlog::trace("x328 rx: {:02x}", fmt::join(received, " "));
      auto event = master_.Feed(received);
      if (!event || !std::holds_alternative<NeedMoreData>(event.Value())) {
        return event;
      }
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      master_.NotifyTimeout();
      spdlog::warn("x328: no answer within {} ms", timeout_.count());
      return ErrorCode::kTimedOut;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

ErrorCode BlockingMaster::FailureOf(MasterEvent const &event) {
  if (auto const *nakd = std::get_if<Nakd>(&event)) {
    last_nak_ = nakd->reason;
    spdlog::debug("x328: node answered {}",
                  nakd->reason == NakReason::kInvalidParameter ? "invalid parameter" : "NAK");
    return ErrorCode::kNak;
  }
  if (auto const *error = std::get_if<ProtocolError>(&event)) {
    spdlog::warn("x328: bad answer: {}", ToString(error->code));
    return error->code;
  }
  return ErrorCode::kFramingError;
}

}  // namespace x328
