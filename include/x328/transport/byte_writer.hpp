#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include "byte_reader.hpp"

namespace x328 {

/**
 * @brief Abstract interface for writing bytes to a bus connection
 */
class ByteWriter {
 public:
  virtual ~ByteWriter() = default;

  /**
   * @brief Write bytes
   * @param data Bytes to write
   * @return Number of bytes written (-1 on error); less than data.size() is a short write
   */
  [[nodiscard]] virtual int Write(std::span<uint8_t const> data) = 0;

  /**
   * @brief Push buffered bytes onto the line
   * @return true on success
   */
  [[nodiscard]] virtual bool Flush() = 0;
};

/**
 * @brief Bidirectional bus connection
 */
class ByteTransport : public ByteReader, public ByteWriter {
 public:
  ~ByteTransport() override = default;
};

}  // namespace x328
