#pragma once
/**
 * @file control_chars.hpp
 * @brief Single-byte control vocabulary of the bitflash transfer protocol.
 *
 * The handshake borrows its bytes from XMODEM:
 *
 * | Name               | Byte  | Direction        | Meaning                              |
 * |--------------------|-------|------------------|--------------------------------------|
 * | StartOfHeader      | 0x01  | host -> device   | first byte of every packet frame     |
 * | EndOfTransmission  | 0x04  | host -> device   | session is over                      |
 * | Ack                | 0x06  | device -> host   | packet (or EOT) accepted             |
 * | Nak                | 0x15  | device -> host   | packet rejected / checksum handshake |
 * | Cancel             | 0x18  | either           | defined, never sent or acted upon    |
 * | StartTransmission  | '1'   | host -> device   | opens a session                      |
 * | ModeC              | 'C'   | device -> host   | CRC-style handshake reply            |
 *
 * Everything here is constexpr; nothing allocates except to_bytes().
 */

#include <cstdint>
#include <initializer_list>
#include <vector>

namespace bitflash {

enum class ControlChar : uint8_t {
  StartOfHeader     = 0x01,
  EndOfTransmission = 0x04,
  Ack               = 0x06,
  Nak               = 0x15,
  Cancel            = 0x18,
  StartTransmission = '1',
  ModeC             = 'C'
};

constexpr uint8_t byte_of(ControlChar c) { return static_cast<uint8_t>(c); }

// Assemble a run of control characters into raw wire bytes.
inline std::vector<uint8_t> to_bytes(std::initializer_list<ControlChar> chars) {
  std::vector<uint8_t> out;
  out.reserve(chars.size());
  for (ControlChar c : chars) out.push_back(byte_of(c));
  return out;
}

/// Short uppercase name for logs ("ACK", "NAK", ...). Unknown bytes yield "?".
const char* control_name(uint8_t byte);

} // namespace bitflash
