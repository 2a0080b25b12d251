#pragma once
/**
 * @file transport_base.hpp
 * @brief Byte-stream transport interface the transfer protocol drives.
 *
 * Header-only. The protocol never sees a file descriptor; it sees this.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bitflash::transport {

// Return codes kept simple; the protocol maps them onto LinkStatus.
enum class RxResult : uint8_t { Ok=0, Timeout=1, Error=2 };

/// Negative read timeout: block until a byte arrives, however long that takes.
constexpr int WAIT_FOREVER = -1;

/**
 * @brief Blocking, half-duplex byte stream.
 *
 * Contract:
 *  - write(bytes) pushes every byte out or returns false (transport error).
 *  - read(out) blocks for one byte, bounded by read_timeout() if it is >= 0.
 *  - read_until(delim) consumes and discards bytes up to and including delim.
 *  - The timeout applies per byte, not per call.
 *  - name() is a short identifier for logs/diagnostics.
 */
class IByteStream {
public:
  virtual ~IByteStream() = default;
  virtual bool      write(const uint8_t* data, std::size_t len) = 0;
  virtual RxResult  read(uint8_t& out) = 0;
  virtual const char* name() const = 0;

  bool write(const std::vector<uint8_t>& bytes) { return write(bytes.data(), bytes.size()); }

  virtual RxResult read_until(uint8_t delim) {
    uint8_t b = 0;
    for (;;) {
      RxResult r = read(b);
      if (r != RxResult::Ok) return r;
      if (b == delim) return RxResult::Ok;
    }
  }

  void set_read_timeout(int ms) { read_timeout_ms_ = ms; }
  int  read_timeout() const { return read_timeout_ms_; }

protected:
  int read_timeout_ms_{WAIT_FOREVER};
};

} // namespace bitflash::transport
