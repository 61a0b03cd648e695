#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include "../common/station_address.hpp"
#include "../common/wire_format_options.hpp"
#include "../frame/frame.hpp"
#include "../frame/frame_parser.hpp"

namespace x328 {

/** The controller sent a new command while a reply to the previous one was still expected */
struct NodeTimeout {
  StationAddress station;

  friend bool operator==(NodeTimeout const &, NodeTimeout const &) = default;
};

/** A node transmitted without an outstanding controller command */
struct UnexpectedTransmission {
  friend bool operator==(UnexpectedTransmission const &, UnexpectedTransmission const &) = default;
};

using ControllerEvent = std::variant<ReadRequest, WriteRequest, SelectSequence, NodeTimeout, ParseError>;

using NodeReply = std::variant<ReadResponse, WriteAck, Nak, ParseError, UnexpectedTransmission>;

struct NodeEvent {
  /** Station the controller addressed; empty for an unexpected transmission */
  std::optional<StationAddress> station;
  NodeReply reply;

  friend bool operator==(NodeEvent const &, NodeEvent const &) = default;
};

template <typename Event>
struct ScanResult {
  std::optional<Event> event;
  /** Bytes taken; pass the rest again together with newly received data */
  size_t consumed{0};
};

/**
 * @brief Passive bus monitor
 *
 * Reconstructs transactions from the two directions of a bus, e.g. the TX lines of the controller
 * and of the nodes on a split RS-485 segment, or a sniffer that can tell them apart. Holds one
 * parser per direction and remembers which reply the last controller command asks for.
 */
class BusScanner {
 public:
  explicit BusScanner(WireFormatOptions options = {})
      : controller_parser_(ParserRole::kCommand, options),
        node_parser_(ParserRole::kResponse, options) {}

  /**
   * @brief Parse bytes sent by the bus controller
   *
   * Empty input returns no event. If a reply is still expected, returns NodeTimeout with nothing
   * consumed and forgets the expectation; the same bytes are then parsed by the next call.
   * Controller bytes that are not a command (stray ACK, NAK or responses) are skipped.
   */
  [[nodiscard]] ScanResult<ControllerEvent> FeedFromController(std::span<uint8_t const> data);

  /**
   * @brief Parse bytes sent by the nodes
   *
   * Data arriving while no command is outstanding is reported as UnexpectedTransmission and
   * consumed entirely.
   */
  [[nodiscard]] ScanResult<NodeEvent> FeedFromNode(std::span<uint8_t const> data);

  /**
   * @brief Station addressed by the outstanding command, if a reply is expected
   */
  [[nodiscard]] std::optional<StationAddress> ExpectedStation() const noexcept;

  void Reset() noexcept;

 private:
  enum class Expect : uint8_t { kCommand, kReadResponse, kWriteResponse, kSelectResponse };

  /** Start expecting a reply from station; node bytes left from earlier exchanges are dropped */
  void Await(StationAddress station, Expect reply) noexcept;
  [[nodiscard]] bool AnswersExpectation(Frame const &frame) const noexcept;

  FrameParser controller_parser_;
  FrameParser node_parser_;
  Expect expect_{Expect::kCommand};
  StationAddress station_{};
};

}  // namespace x328
