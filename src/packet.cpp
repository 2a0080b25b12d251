// -----------------------------------------------------------------------------
// @file packet.cpp
// @brief Implementation of the bitflash Packet frame and its decoder.
//
// Implemented here:
// - Big-endian fixed-width integer encoding (encode_be)
// - Payload checksum (sum mod 256)
// - Packet serialization to the wire frame
// - Frame decoding back into fields (used by tests and the debug log)
// -----------------------------------------------------------------------------
#include "bitflash/packet.hpp"
#include "bitflash/control_chars.hpp"

#include <utility>

namespace bitflash {

// =============================================================================
// Helpers
// =============================================================================

void encode_be(std::vector<uint8_t>& out, uint32_t value, std::size_t width) {
  // Most significant byte first; anything wider than 4 bytes pads with zeros.
  for (std::size_t i = width; i-- > 0;) {
    out.push_back(i < 4 ? static_cast<uint8_t>((value >> (i * 8)) & 0xFF) : 0);
  }
}

std::vector<uint8_t> encode_be(uint32_t value, std::size_t width) {
  std::vector<uint8_t> out;
  out.reserve(width);
  encode_be(out, value, width);
  return out;
}

uint8_t checksum(const uint8_t* data, std::size_t len) {
  uint8_t sum = 0;
  for (std::size_t i = 0; i < len; ++i) sum = static_cast<uint8_t>(sum + data[i]);
  return sum;
}

// =============================================================================
// Packet
// =============================================================================

Packet::Packet(uint16_t block_id, std::vector<uint8_t> payload)
    : block_id_(block_id), payload_(std::move(payload)) {}

Packet::Packet(uint16_t block_id, const uint8_t* data, std::size_t len)
    : block_id_(block_id), payload_(data, data + len) {}

std::vector<uint8_t> Packet::serialize() const {
  std::vector<uint8_t> out;
  out.reserve(payload_.size() + OVERHEAD);

  out.push_back(byte_of(ControlChar::StartOfHeader));
  encode_be(out, block_id_, 2);
  // Length wraps at 16 bits; oversized payloads are the caller's problem.
  encode_be(out, static_cast<uint32_t>(payload_.size()), 2);
  out.insert(out.end(), payload_.begin(), payload_.end());
  out.push_back(checksum(payload_));
  return out;
}

// =============================================================================
// Decoding
// =============================================================================

std::optional<DecodedPacket> decode_packet(const uint8_t* frame, std::size_t len,
                                           std::size_t* consumed) {
  if (!frame || len < Packet::OVERHEAD) return std::nullopt;
  if (frame[0] != byte_of(ControlChar::StartOfHeader)) return std::nullopt;

  DecodedPacket pkt;
  pkt.block_id = static_cast<uint16_t>((frame[1] << 8) | frame[2]);
  const std::size_t plen = static_cast<std::size_t>((frame[3] << 8) | frame[4]);

  const std::size_t total = Packet::OVERHEAD + plen;
  if (len < total) return std::nullopt;  // truncated payload or missing checksum

  pkt.payload.assign(frame + 5, frame + 5 + plen);
  pkt.checksum = frame[5 + plen];
  pkt.checksum_ok = (pkt.checksum == checksum(pkt.payload));

  if (consumed) *consumed = total;
  return pkt;
}

} // namespace bitflash
