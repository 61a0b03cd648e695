#pragma once

#include <cstdint>
#include <span>
#include <variant>
#include "../common/error_code.hpp"
#include "../common/frame_buffer.hpp"
#include "../common/parameter.hpp"
#include "../common/result.hpp"
#include "../common/station_address.hpp"
#include "../common/wire_format_options.hpp"
#include "../frame/frame.hpp"
#include "../frame/frame_parser.hpp"

namespace x328 {

enum class MasterState : uint8_t {
  kIdle,
  /** Select sequence sent, waiting for ACK */
  kAwaitingSelectAck,
  /** Read or write request sent, waiting for the node's answer */
  kAwaitingResponse
};

/**
 * @brief How the most recent transaction ended
 */
enum class MasterOutcome : uint8_t {
  kNone,
  kCompleted,
  kNakd,
  kTimedOut,
  kProtocolError
};

/** A read transaction completed with the node's value */
struct ReadCompleted {
  ParameterValue value;

  friend bool operator==(ReadCompleted const &, ReadCompleted const &) = default;
};

/** A write transaction was acknowledged */
struct WriteAcked {
  friend bool operator==(WriteAcked const &, WriteAcked const &) = default;
};

/** The selected station answered the select sequence */
struct SelectAcked {
  friend bool operator==(SelectAcked const &, SelectAcked const &) = default;
};

/** The node rejected the transaction */
struct Nakd {
  NakReason reason{NakReason::kCommandFailed};

  friend bool operator==(Nakd const &, Nakd const &) = default;
};

using MasterEvent = std::variant<NeedMoreData, ReadCompleted, WriteAcked, SelectAcked, Nakd, ProtocolError>;

/**
 * @brief Sans-IO X3.28 master (bus controller) state machine
 *
 * Start*() produces the request bytes for the host to transmit and arms the machine; Feed() takes
 * the received bytes and reports the outcome. At most one transaction is outstanding. Every outcome
 * other than NeedMoreData returns the machine to kIdle; bytes received after the answer are dropped.
 * Timeouts belong to the host: it calls NotifyTimeout() when its deadline passes.
 */
class Master {
 public:
  explicit Master(WireFormatOptions options = {})
      : options_(options),
        parser_(ParserRole::kResponse, options) {}

  /**
   * @brief Begin a parameter read
   * @return Request bytes, or ErrorCode::kSequenceError if a transaction is outstanding
   */
  [[nodiscard]] Result<FrameBuffer> StartRead(StationAddress address, ParameterNumber parameter);

  /**
   * @brief Begin a parameter read from raw integers
   * @return Request bytes, or kSequenceError, kInvalidAddress or kInvalidParameter
   */
  [[nodiscard]] Result<FrameBuffer> StartRead(int address, int parameter);

  /**
   * @brief Begin a parameter write
   * @return Request bytes, or ErrorCode::kSequenceError if a transaction is outstanding
   */
  [[nodiscard]] Result<FrameBuffer> StartWrite(StationAddress address, ParameterNumber parameter,
                                               ParameterValue value);

  /**
   * @brief Begin a parameter write from raw integers
   *
   * All fields are validated before any bytes are produced.
   *
   * @return Request bytes, or kSequenceError, kInvalidAddress, kInvalidParameter or kValueOutOfRange
   */
  [[nodiscard]] Result<FrameBuffer> StartWrite(int address, int parameter, int64_t value);

  /**
   * @brief Begin a presence poll; a node that is present answers ACK
   * @return Select sequence bytes, or ErrorCode::kSequenceError if a transaction is outstanding
   */
  [[nodiscard]] Result<FrameBuffer> StartSelect(StationAddress address);

  /**
   * @brief Presence poll from a raw integer address
   * @return Select sequence bytes, or kSequenceError or kInvalidAddress
   */
  [[nodiscard]] Result<FrameBuffer> StartSelect(int address);

  /**
   * @brief Feed bytes received from the bus
   * @return The transaction event, or ErrorCode::kSequenceError when no transaction is outstanding
   */
  [[nodiscard]] Result<MasterEvent> Feed(std::span<uint8_t const> data);

  /**
   * @brief The host's deadline passed without a complete answer
   * @return true if a transaction was outstanding and is now abandoned
   */
  bool NotifyTimeout() noexcept;

  /**
   * @brief Abandon any transaction and return to kIdle
   */
  void Reset() noexcept;

  [[nodiscard]] MasterState GetState() const noexcept { return state_; }
  [[nodiscard]] MasterOutcome LastOutcome() const noexcept { return last_outcome_; }
  [[nodiscard]] bool IsIdle() const noexcept { return state_ == MasterState::kIdle; }

 private:
  enum class PendingKind : uint8_t { kRead, kWrite, kSelect };

  Result<FrameBuffer> Arm(Frame const &request, PendingKind kind, MasterState state);
  MasterEvent Finish(MasterEvent event, MasterOutcome outcome) noexcept;
  MasterEvent OnFrame(Frame const &frame) noexcept;

  WireFormatOptions options_;
  FrameParser parser_;
  MasterState state_{MasterState::kIdle};
  PendingKind pending_{PendingKind::kRead};
  MasterOutcome last_outcome_{MasterOutcome::kNone};
};

}  // namespace x328
