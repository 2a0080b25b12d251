#pragma once
/**
 * @file transmitter.hpp
 * @brief Orchestrates one bitstream upload on top of TransferProtocol.
 *
 * An upload is:
 *   1) start_transmission()
 *   2) metadata packet, block 0: BE32(target address) ++ BE32(packet count)
 *   3) body packets, block 1..N: the file in 256-byte slices (last one may be short)
 *   4) stop_transmission()
 *
 * packet count = ceil(len / 256); an empty file still sends the metadata
 * packet (count 0) and the EOT.
 *
 * By default a NAK does not stop the transfer: it is counted in the report and
 * the next chunk goes out. Set TransmitterOptions::strict to abort on the first
 * NAK instead (no EOT is sent in that case). Timeouts and transport errors always
 * abort.
 *
 * @code
 *   transport::LinuxSerial port;
 *   port.open({"/dev/ttyACM0"});
 *   TransferProtocol proto(port);
 *   Transmitter tx(proto);
 *   UploadReport rep = tx.upload(bytes, 0x03);
 *   if (!rep.ok()) { ... }
 * @endcode
 */

#include "bitflash/log.hpp"
#include "bitflash/transfer_protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bitflash {

struct TransmitterOptions {
  bool strict{false};   // abort on NAK
};

struct UploadReport {
  LinkStatus status{LinkStatus::Ok};
  Mode mode{Mode::Unset};
  uint32_t packet_count{0};   // body packets the file needs
  uint32_t packets_sent{0};   // frames written, metadata included
  uint32_t naks{0};           // frames answered with NAK
  std::size_t bytes_sent{0};  // body payload bytes written

  bool ok() const { return status == LinkStatus::Ok; }
};

class Transmitter {
public:
  explicit Transmitter(TransferProtocol& protocol, TransmitterOptions opts = {},
                       Log& log = Log::null());

  /// ceil(file_length / Packet::MAX_SIZE).
  static uint32_t packets_required(std::size_t file_length);

  /// Payload of the block-0 packet.
  static std::vector<uint8_t> metadata_payload(uint32_t target_address, uint32_t packet_count);

  UploadReport upload(const std::vector<uint8_t>& data, uint32_t target_address);

private:
  // Sends one packet and folds the outcome into @p rep. Returns false to abort.
  bool send(const Packet& packet, UploadReport& rep);

  TransferProtocol& protocol_;
  TransmitterOptions opts_;
  Log& log_;
};

} // namespace bitflash
