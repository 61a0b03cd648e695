#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "../common/frame_buffer.hpp"
#include "../common/result.hpp"
#include "../common/station_address.hpp"
#include "../common/wire_format_options.hpp"
#include "../slave/slave.hpp"
#include "../transport/byte_writer.hpp"
#include "parameter_handler.hpp"

namespace x328 {

/**
 * @brief Runs a Slave on a ByteTransport and answers requests through a ParameterHandler
 *
 * Bytes that arrive behind a request are kept until the request has been answered, so several
 * frames received in one read are all served.
 */
class SlavePort {
 public:
  SlavePort(StationAddress address, ParameterHandler &handler, WireFormatOptions options = {})
      : slave_(address, options),
        handler_(handler) {}

  /**
   * @brief Read whatever the transport has and answer every complete request for this station
   * @return Number of answers transmitted, or ErrorCode::kTransportError
   */
  [[nodiscard]] Result<size_t> Poll(ByteTransport &transport);

  [[nodiscard]] Slave const &GetSlave() const noexcept { return slave_; }

  [[nodiscard]] StationAddress GetAddress() const noexcept { return slave_.GetAddress(); }
  void SetAddress(StationAddress address);

 private:
  [[nodiscard]] Result<FrameBuffer> Dispatch(SlaveEvent const &event);
  [[nodiscard]] Result<void> Transmit(FrameBuffer const &answer, ByteTransport &transport);

  Slave slave_;
  ParameterHandler &handler_;
  std::vector<uint8_t> received_{};
};

}  // namespace x328
