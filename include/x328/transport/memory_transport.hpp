#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace x328 {

/**
 * @brief In-memory transport for tests and loopback setups
 *
 * Read() serves the bytes queued with SetReadData()/AppendReadData(); Write() records into a
 * separate buffer inspected with GetWrittenData().
 */
class MemoryTransport : public ByteTransport {
 public:
  static constexpr size_t kDefaultInitialCapacity = 256;

  explicit MemoryTransport(size_t initial_capacity = kDefaultInitialCapacity) {
    read_buffer_.reserve(initial_capacity);
    write_buffer_.reserve(initial_capacity);
  }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override {
    if (read_pos_ >= read_buffer_.size()) {
      return 0;
    }

    size_t bytes_to_read = std::min(buffer.size(), read_buffer_.size() - read_pos_);
    std::copy_n(read_buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_), bytes_to_read, buffer.begin());
    read_pos_ += bytes_to_read;
    return static_cast<int>(bytes_to_read);
  }

  [[nodiscard]] bool HasData() const override { return read_pos_ < read_buffer_.size(); }

  [[nodiscard]] size_t AvailableBytes() const override { return read_buffer_.size() - read_pos_; }

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<uint8_t const> data) override {
    if (write_limit_.has_value()) {
      size_t const accepted = std::min(data.size(), *write_limit_);
      write_buffer_.insert(write_buffer_.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(accepted));
      return static_cast<int>(accepted);
    }
    write_buffer_.insert(write_buffer_.end(), data.begin(), data.end());
    return static_cast<int>(data.size());
  }

  [[nodiscard]] bool Flush() override { return true; }

  /**
   * @brief Replace the data that will be read by Read()
   */
  void SetReadData(std::span<uint8_t const> data) {
    read_buffer_.assign(data.begin(), data.end());
    read_pos_ = 0;
  }

  /**
   * @brief Queue more data behind what is still unread
   */
  void AppendReadData(std::span<uint8_t const> data) { read_buffer_.insert(read_buffer_.end(), data.begin(), data.end()); }

  [[nodiscard]] std::span<uint8_t const> GetWrittenData() const { return {write_buffer_.data(), write_buffer_.size()}; }

  void ClearWriteBuffer() { write_buffer_.clear(); }

  void ResetReadPosition() { read_pos_ = 0; }

  /**
   * @brief Accept at most limit bytes per Write() call, to simulate a short write
   */
  void SetWriteLimit(size_t limit) { write_limit_ = limit; }

 private:
  std::vector<uint8_t> read_buffer_;
  size_t read_pos_{0};
  std::vector<uint8_t> write_buffer_;
  std::optional<size_t> write_limit_;
};

}  // namespace x328
