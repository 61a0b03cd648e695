#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>
#include "../common/frame_buffer.hpp"
#include "../common/parameter.hpp"
#include "../common/result.hpp"
#include "../common/station_address.hpp"
#include "../common/wire_format_options.hpp"
#include "../frame/frame.hpp"
#include "../frame/frame_parser.hpp"

namespace x328 {

enum class SlaveState : uint8_t {
  /** Between frames */
  kIdle,
  /** A frame has started, its address field is incomplete */
  kMatchingAddress,
  /** Address known, rest of the frame still arriving */
  kParsingCommand,
  /** A request for this station was delivered; waiting for the application's answer */
  kDispatching
};

/** The master polled this station with a select sequence */
struct StationSelected {
  friend bool operator==(StationSelected const &, StationSelected const &) = default;
};

struct ParameterReadRequested {
  ParameterNumber parameter;

  friend bool operator==(ParameterReadRequested const &, ParameterReadRequested const &) = default;
};

struct ParameterWriteRequested {
  ParameterNumber parameter;
  ParameterValue value;

  friend bool operator==(ParameterWriteRequested const &, ParameterWriteRequested const &) = default;
};

using SlaveEvent =
    std::variant<NeedMoreData, StationSelected, ParameterReadRequested, ParameterWriteRequested, ProtocolError>;

struct SlaveFeedResult {
  SlaveEvent event;
  /** Bytes of the input taken; feed the rest again after answering */
  size_t consumed{0};
};

/**
 * @brief Sans-IO X3.28 slave (bus node) state machine for one station address
 *
 * Feed() listens to everything on the bus and only reports what concerns this station: requests
 * addressed to it, and malformed frames whose address field matched. Traffic for other stations
 * and other nodes' answers are consumed silently.
 *
 * After a request event the application answers with exactly one of RespondValue() (reads),
 * Acknowledge() (writes and select) or RespondNak() and transmits the returned bytes. After a
 * ProtocolError event it may answer with RespondNak().
 */
class Slave {
 public:
  explicit Slave(StationAddress address, WireFormatOptions options = {})
      : address_(address),
        options_(options),
        parser_(ParserRole::kCommand, options) {}

  /**
   * @brief Feed bytes received from the bus
   * @return The first event for this station and the bytes consumed up to it, or
   *         ErrorCode::kSequenceError while a request is still waiting for its answer
   */
  [[nodiscard]] Result<SlaveFeedResult> Feed(std::span<uint8_t const> data);

  /**
   * @brief Answer a pending read with its value
   * @return Response bytes, or ErrorCode::kSequenceError if no read is pending
   */
  [[nodiscard]] Result<FrameBuffer> RespondValue(ParameterValue value);

  /**
   * @brief Answer a pending read with a raw value
   * @return Response bytes, or kSequenceError or kValueOutOfRange (the read stays pending)
   */
  [[nodiscard]] Result<FrameBuffer> RespondValue(int64_t value);

  /**
   * @brief Accept a pending write or select
   * @return ACK, or ErrorCode::kSequenceError if no write or select is pending
   */
  [[nodiscard]] Result<FrameBuffer> Acknowledge();

  /**
   * @brief Reject the pending request, or the malformed frame just reported
   * @return NAK or EOT, or ErrorCode::kSequenceError if there is nothing to reject
   */
  [[nodiscard]] Result<FrameBuffer> RespondNak(NakReason reason = NakReason::kCommandFailed);

  /**
   * @brief Drop any partial frame and any pending request
   */
  void Reset() noexcept;

  [[nodiscard]] SlaveState GetState() const noexcept;

  [[nodiscard]] StationAddress GetAddress() const noexcept { return address_; }

  /**
   * @brief Change the station address; also resets the machine
   */
  void SetAddress(StationAddress address) noexcept;

  [[nodiscard]] bool HasPendingRequest() const noexcept { return pending_ != PendingKind::kNone; }

 private:
  enum class PendingKind : uint8_t { kNone, kRead, kWrite, kSelect };

  [[nodiscard]] bool IsForThisStation(Frame const &frame) const noexcept;
  FrameBuffer Answer(Frame const &frame);

  StationAddress address_;
  WireFormatOptions options_;
  FrameParser parser_;
  PendingKind pending_{PendingKind::kNone};
  bool nak_allowed_{false};
};

}  // namespace x328
