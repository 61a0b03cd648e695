#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace x328 {

/**
 * @brief Abstract interface for reading bytes from a bus connection
 *
 * The protocol engine never touches a transport; the blocking adapters in x328_io read through this
 * interface so they work with a serial port, a socket bridge or an in-memory buffer alike.
 */
class ByteReader {
 public:
  virtual ~ByteReader() = default;

  /**
   * @brief Read the bytes that are available now, without waiting
   * @param buffer Destination; at most buffer.size() bytes are read
   * @return Number of bytes read (0 if none available, -1 on error)
   */
  [[nodiscard]] virtual int Read(std::span<uint8_t> buffer) = 0;

  /**
   * @brief Check if data is available to read
   */
  [[nodiscard]] virtual bool HasData() const = 0;

  /**
   * @brief Number of bytes available to read (0 if unknown)
   */
  [[nodiscard]] virtual size_t AvailableBytes() const = 0;
};

}  // namespace x328
