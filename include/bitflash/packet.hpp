/**
 * @file packet.hpp
 * @brief bitflash Packet — one framed chunk of a bitstream upload.
 *
 * Every chunk of the file travels inside a fixed frame. The layout is inspired
 * by XMODEM, except the two bytes after the block number carry the payload
 * length instead of the complemented block number:
 *
 * | Field           | Bytes | Encoding                          |
 * |-----------------|-------|-----------------------------------|
 * | start of header | 1     | constant 0x01                     |
 * | block id        | 2     | big-endian unsigned               |
 * | payload length  | 2     | big-endian unsigned               |
 * | payload         | 0-256 | raw                               |
 * | checksum        | 1     | sum of payload bytes, modulo 256  |
 *
 * Block id 0 is reserved for the metadata packet (target address + packet
 * count). Block ids 1..N carry file content in order.
 *
 * ### Example
 * A packet with block id 2 and payload `{0x10, 0x20}` serializes to:
 * `[0x01, 0x00, 0x02, 0x00, 0x02, 0x10, 0x20, 0x30]`
 *
 * @note The block id is write-only. It exists to be encoded, never inspected,
 *       so there is no getter. Use decode_packet() to look inside a frame.
 * @note The 256-byte payload limit is the caller's contract. serialize() does
 *       not check it; an oversized payload yields a length field the device
 *       will not accept.
 */

#ifndef BITFLASH_PACKET_HPP
#define BITFLASH_PACKET_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace bitflash {

/**
 * @brief Append @p value to @p out as @p width big-endian bytes.
 *
 * Bits above width*8 are dropped without warning; callers make sure the value
 * fits the field.
 */
void encode_be(std::vector<uint8_t>& out, uint32_t value, std::size_t width);

/// Same as encode_be() but returns a fresh buffer.
std::vector<uint8_t> encode_be(uint32_t value, std::size_t width);

/// Sum of all bytes modulo 256.
uint8_t checksum(const uint8_t* data, std::size_t len);
inline uint8_t checksum(const std::vector<uint8_t>& data) { return checksum(data.data(), data.size()); }

class Packet {
public:
  /// Maximum payload bytes per packet (and the chunk size of an upload).
  static constexpr std::size_t MAX_SIZE = 256;

  /// Bytes a frame adds around its payload: SOH + id(2) + len(2) + checksum.
  static constexpr std::size_t OVERHEAD = 6;

  Packet(uint16_t block_id, std::vector<uint8_t> payload);
  Packet(uint16_t block_id, const uint8_t* data, std::size_t len);

  void set_block_id(uint16_t block_id) { block_id_ = block_id; }

  const std::vector<uint8_t>& payload() const { return payload_; }

  /// Full wire frame. Pure; the packet can be serialized any number of times.
  std::vector<uint8_t> serialize() const;

private:
  uint16_t block_id_;
  std::vector<uint8_t> payload_;
};

/**
 * @struct DecodedPacket
 * @brief Result of parsing one wire frame back into its fields.
 */
struct DecodedPacket {
  uint16_t block_id{0};
  std::vector<uint8_t> payload;
  uint8_t checksum{0};      ///< checksum byte as found on the wire
  bool checksum_ok{false};  ///< true if it matches the payload sum
};

/**
 * @brief Parse one frame from the start of @p frame.
 *
 * Returns std::nullopt if the first byte is not START_OF_HEADER, or if the
 * buffer is too short for the header, the declared payload, or the checksum.
 * A checksum mismatch still decodes; check DecodedPacket::checksum_ok.
 *
 * @param consumed  If non-null, receives the number of bytes the frame used.
 */
std::optional<DecodedPacket> decode_packet(const uint8_t* frame, std::size_t len,
                                           std::size_t* consumed = nullptr);

inline std::optional<DecodedPacket> decode_packet(const std::vector<uint8_t>& frame,
                                                  std::size_t* consumed = nullptr) {
  return decode_packet(frame.data(), frame.size(), consumed);
}

} // namespace bitflash

#endif // BITFLASH_PACKET_HPP
