#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include "../common/frame_buffer.hpp"
#include "../common/parameter.hpp"
#include "../common/result.hpp"
#include "../common/wire_format_options.hpp"
#include "../frame/frame.hpp"
#include "../master/master.hpp"
#include "../transport/byte_writer.hpp"

namespace x328 {

/**
 * @brief Synchronous X3.28 bus controller over a ByteTransport
 *
 * Each call transmits one request and polls the transport until the answer is complete or the
 * timeout passes. Not thread-safe; one transaction at a time.
 */
class BlockingMaster {
 public:
  static constexpr std::chrono::milliseconds kDefaultTimeout{500};

  explicit BlockingMaster(ByteTransport &transport, WireFormatOptions options = {},
                          std::chrono::milliseconds timeout = kDefaultTimeout)
      : transport_(transport),
        master_(options),
        timeout_(timeout) {}

  /**
   * @brief Read a parameter from a station
   * @return The value; kNak if the node rejected the read (see LastNakReason()), kTimedOut,
   *         kTransportError, a protocol error code, or a range error for address / parameter
   */
  [[nodiscard]] Result<ParameterValue> ReadParameter(int address, int parameter);

  /**
   * @brief Write a parameter on a station
   * @return Success, or the same errors as ReadParameter() plus kValueOutOfRange
   */
  [[nodiscard]] Result<void> WriteParameter(int address, int parameter, int64_t value);

  /**
   * @brief Poll a station for presence
   * @return Success if the station acknowledged
   */
  [[nodiscard]] Result<void> Select(int address);

  /**
   * @brief Reason given by the node in the most recent NAK, if the last transaction ended in one
   */
  [[nodiscard]] std::optional<NakReason> LastNakReason() const noexcept { return last_nak_; }

  [[nodiscard]] std::chrono::milliseconds GetTimeout() const noexcept { return timeout_; }
  void SetTimeout(std::chrono::milliseconds timeout) noexcept { timeout_ = timeout; }

  [[nodiscard]] Master const &GetMaster() const noexcept { return master_; }

 private:
  [[nodiscard]] Result<MasterEvent> Transact(Result<FrameBuffer> const &request);
  [[nodiscard]] Result<MasterEvent> AwaitAnswer();
  [[nodiscard]] ErrorCode FailureOf(MasterEvent const &event);

  ByteTransport &transport_;
  Master master_;
  std::chrono::milliseconds timeout_;
  std::optional<NakReason> last_nak_{};
};

}  // namespace x328
