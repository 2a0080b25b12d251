#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty transport (header-only, termios via serial_io).
 *
 * Owns the descriptor: open() acquires it, the destructor releases it, so a
 * transfer that bails out half way still closes the port.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "bitflash/transport/transport_base.hpp"
#include "serial_io.hpp"
#include <string>
#include <utility>

namespace bitflash::transport {

struct SerialConfig {
  std::string path;        // e.g. /dev/serial/by-id/usb-...
  int baud{115200};
  int boot_delay_ms{400};  // USB CDC devices reset on open
  int read_timeout_ms{WAIT_FOREVER};
};

class LinuxSerial : public IByteStream {
public:
  LinuxSerial() = default;
  ~LinuxSerial() override { close(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  LinuxSerial(LinuxSerial&& other) noexcept
  : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {
    read_timeout_ms_ = other.read_timeout_ms_;
  }

  LinuxSerial& operator=(LinuxSerial&& other) noexcept {
    if (this != &other) {
      close();
      fd_ = std::exchange(other.fd_, -1);
      path_ = std::move(other.path_);
      read_timeout_ms_ = other.read_timeout_ms_;
    }
    return *this;
  }

  bool open(const SerialConfig& cfg) {
    close();
    path_ = cfg.path;
    if (path_.empty()) return false;
    read_timeout_ms_ = cfg.read_timeout_ms;
    fd_ = open_serial(path_, cfg.baud, cfg.boot_delay_ms);
    return fd_ >= 0;
  }

  void close() {
    if (fd_ >= 0) { close_serial(fd_); fd_ = -1; }
  }

  bool is_open() const { return fd_ >= 0; }
  const std::string& path() const { return path_; }

  using IByteStream::write;

  bool write(const uint8_t* data, std::size_t len) override {
    return write_all(fd_, data, len);
  }

  RxResult read(uint8_t& out) override {
    int r = read_byte(fd_, out, read_timeout_ms_);
    if (r > 0)  return RxResult::Ok;
    if (r == 0) return RxResult::Timeout;
    return RxResult::Error;
  }

  const char* name() const override { return "linux-serial"; }

private:
  int fd_{-1};
  std::string path_;
};

} // namespace bitflash::transport
