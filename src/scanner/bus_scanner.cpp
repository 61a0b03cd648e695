#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include "scanner/bus_scanner.hpp"

namespace x328 {

ScanResult<ControllerEvent> BusScanner::FeedFromController(std::span<uint8_t const> data) {
  if (data.empty()) {
    return {std::nullopt, 0};
  }
  if (expect_ != Expect::kCommand) {
    expect_ = Expect::kCommand;
    node_parser_.Reset();
    return {ControllerEvent{NodeTimeout{station_}}, 0};
  }

  size_t consumed = 0;
  while (consumed < data.size()) {
    ParseResult const result = controller_parser_.Feed(data.subspan(consumed));
    consumed += result.consumed;

    if (auto const *error = std::get_if<ParseError>(&result.event)) {
      return {ControllerEvent{*error}, consumed};
    }
    auto const *frame = std::get_if<Frame>(&result.event);
    if (frame == nullptr) {
      break;
    }

    if (auto const *read = std::get_if<ReadRequest>(frame)) {
      Await(read->address, Expect::kReadResponse);
      return {ControllerEvent{*read}, consumed};
    }
    if (auto const *write = std::get_if<WriteRequest>(frame)) {
      Await(write->address, Expect::kWriteResponse);
      return {ControllerEvent{*write}, consumed};
    }
    if (auto const *select = std::get_if<SelectSequence>(frame)) {
      Await(select->address, Expect::kSelectResponse);
      return {ControllerEvent{*select}, consumed};
    }
  }
  return {std::nullopt, consumed};
}

ScanResult<NodeEvent> BusScanner::FeedFromNode(std::span<uint8_t const> data) {
  if (data.empty()) {
    return {std::nullopt, 0};
  }
  if (expect_ == Expect::kCommand) {
    return {NodeEvent{std::nullopt, UnexpectedTransmission{}}, data.size()};
  }

  ParseResult const result = node_parser_.Feed(data);
  if (auto const *error = std::get_if<ParseError>(&result.event)) {
    expect_ = Expect::kCommand;
    return {NodeEvent{station_, ParseError{error->code, station_}}, result.consumed};
  }

  auto const *frame = std::get_if<Frame>(&result.event);
  if (frame == nullptr) {
    return {std::nullopt, result.consumed};
  }

  bool const answers = AnswersExpectation(*frame);
  expect_ = Expect::kCommand;
  if (!answers) {
    return {NodeEvent{station_, ParseError{ErrorCode::kFramingError, station_}}, result.consumed};
  }
  if (auto const *response = std::get_if<ReadResponse>(frame)) {
    return {NodeEvent{station_, *response}, result.consumed};
  }
  if (auto const *nak = std::get_if<Nak>(frame)) {
    return {NodeEvent{station_, *nak}, result.consumed};
  }
  return {NodeEvent{station_, WriteAck{}}, result.consumed};
}

std::optional<StationAddress> BusScanner::ExpectedStation() const noexcept {
  if (expect_ == Expect::kCommand) {
    return std::nullopt;
  }
  return station_;
}

void BusScanner::Reset() noexcept {
  controller_parser_.Reset();
  node_parser_.Reset();
  expect_ = Expect::kCommand;
}

void BusScanner::Await(StationAddress station, Expect reply) noexcept {
  node_parser_.Reset();
  station_ = station;
  expect_ = reply;
}

bool BusScanner::AnswersExpectation(Frame const &frame) const noexcept {
  if (std::holds_alternative<Nak>(frame)) {
    return true;
  }
  switch (expect_) {
    case Expect::kReadResponse:
      return std::holds_alternative<ReadResponse>(frame);
    case Expect::kWriteResponse:
    case Expect::kSelectResponse:
      return std::holds_alternative<WriteAck>(frame);
    case Expect::kCommand:
      return false;
  }
  return false;
}

}  // namespace x328
