/**
 * @file serial_transport.hpp
 * @brief POSIX serial port transport for the example tools
 *
 * X3.28 links usually run 7 data bits, even parity, 1 stop bit. For a virtual pair:
 *   socat -d -d pty,raw,echo=0 pty,raw,echo=0
 */

#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <utility>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <termios.h>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "x328/transport/byte_reader.hpp"
#include "x328/transport/byte_writer.hpp"

namespace x328 {

/**
 * @brief Serial line settings
 */
struct SerialSettings {
  int baud_rate{9600};
  char parity{'E'};
  int data_bits{7};
  int stop_bits{1};
};

/**
 * @brief Non-blocking termios serial port
 *
 * Read() returns immediately with whatever the driver has buffered, which is what the blocking
 * adapters expect: they poll with their own deadline.
 */
class SerialTransport : public ByteTransport {
 public:
  explicit SerialTransport(std::string port_name, SerialSettings settings = {})
      : port_name_(std::move(port_name)),
        settings_(settings) {
    Open();
  }

  ~SerialTransport() override { Close(); }

  SerialTransport(SerialTransport const &) = delete;
  SerialTransport &operator=(SerialTransport const &) = delete;

  [[nodiscard]] bool IsOpen() const { return fd_ >= 0; }

  [[nodiscard]] std::string const &GetPortName() const { return port_name_; }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override {
    if (fd_ < 0) {
      return -1;
    }
    ssize_t bytes_read = ::read(fd_, buffer.data(), buffer.size());
    if (bytes_read < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return 0;
      }
      return -1;
    }
    return static_cast<int>(bytes_read);
  }

  [[nodiscard]] bool HasData() const override { return AvailableBytes() > 0; }

  [[nodiscard]] size_t AvailableBytes() const override {
    if (fd_ < 0) {
      return 0;
    }
    int bytes_available = 0;
    if (::ioctl(fd_, FIONREAD, &bytes_available) == 0 && bytes_available > 0) {
      return static_cast<size_t>(bytes_available);
    }
    return 0;
  }

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<uint8_t const> data) override {
    if (fd_ < 0) {
      return -1;
    }
    size_t written = 0;
    while (written < data.size()) {
      ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
      if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          WaitWritable();
          continue;
        }
        return written > 0 ? static_cast<int>(written) : -1;
      }
      written += static_cast<size_t>(n);
    }
    return static_cast<int>(written);
  }

  [[nodiscard]] bool Flush() override { return fd_ >= 0 && ::tcdrain(fd_) == 0; }

 private:
  bool Open() {
    fd_ = ::open(port_name_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
      spdlog::error("cannot open {}: {}", port_name_, std::strerror(errno));
      return false;
    }

    struct termios tty;
    if (::tcgetattr(fd_, &tty) != 0) {
      return Fail("tcgetattr");
    }

    speed_t speed = GetBaudRate(settings_.baud_rate);
    if (::cfsetispeed(&tty, speed) != 0 || ::cfsetospeed(&tty, speed) != 0) {
      return Fail("cfsetspeed");
    }

    ::cfmakeraw(&tty);
    tty.c_cflag &= ~(CSIZE | PARENB | PARODD | CSTOPB | CRTSCTS);
    tty.c_cflag |= settings_.data_bits == 7 ? CS7 : CS8;
    switch (settings_.parity) {
      case 'E':
      case 'e':
        tty.c_cflag |= PARENB;
        break;
      case 'O':
      case 'o':
        tty.c_cflag |= PARENB | PARODD;
        break;
      default:
        break;
    }
    if (settings_.stop_bits == 2) {
      tty.c_cflag |= CSTOPB;
    }
    tty.c_cflag |= CLOCAL | CREAD;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
      return Fail("tcsetattr");
    }
    spdlog::info("opened {} at {} baud, {}{}{}", port_name_, settings_.baud_rate, settings_.data_bits,
                 settings_.parity, settings_.stop_bits);
    return true;
  }

  bool Fail(char const *call) {
    spdlog::error("{} on {} failed: {}", call, port_name_, std::strerror(errno));
    Close();
    return false;
  }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  void WaitWritable() const {
    fd_set write_fds;
    FD_ZERO(&write_fds);
    FD_SET(fd_, &write_fds);
    struct timeval timeout = {0, 100000};
    ::select(fd_ + 1, nullptr, &write_fds, nullptr, &timeout);
  }

  static speed_t GetBaudRate(int baud) {
    switch (baud) {
      case 1200:
        return B1200;
      case 2400:
        return B2400;
      case 4800:
        return B4800;
      case 19200:
        return B19200;
      case 38400:
        return B38400;
      case 57600:
        return B57600;
      case 115200:
        return B115200;
      case 9600:
      default:
        return B9600;
    }
  }

  std::string port_name_;
  SerialSettings settings_;
  int fd_{-1};
};

}  // namespace x328
