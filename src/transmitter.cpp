// ============================================================================
// transmitter.cpp — implementation for transmitter.hpp
// ============================================================================

#include "bitflash/transmitter.hpp"

#include <algorithm>
#include <sstream>
#include <string>

namespace bitflash {

Transmitter::Transmitter(TransferProtocol& protocol, TransmitterOptions opts, Log& log)
    : protocol_(protocol), opts_(opts), log_(log) {}

uint32_t Transmitter::packets_required(std::size_t file_length) {
  return static_cast<uint32_t>((file_length + Packet::MAX_SIZE - 1) / Packet::MAX_SIZE);
}

std::vector<uint8_t> Transmitter::metadata_payload(uint32_t target_address, uint32_t packet_count) {
  std::vector<uint8_t> payload;
  payload.reserve(8);
  encode_be(payload, target_address, 4);
  encode_be(payload, packet_count, 4);
  return payload;
}

bool Transmitter::send(const Packet& packet, UploadReport& rep) {
  LinkStatus s = protocol_.send_packet(packet);
  ++rep.packets_sent;

  if (s == LinkStatus::Nak) {
    ++rep.naks;
    if (opts_.strict) {
      rep.status = LinkStatus::Nak;
      log_.error("status=error reason=nak packet=" + std::to_string(rep.packets_sent - 1));
      return false;
    }
    log_.info("warning=nak_ignored packet=" + std::to_string(rep.packets_sent - 1));
    return true;
  }
  if (s != LinkStatus::Ok) {
    rep.status = s;
    return false;
  }
  return true;
}

UploadReport Transmitter::upload(const std::vector<uint8_t>& data, uint32_t target_address) {
  UploadReport rep;
  rep.packet_count = packets_required(data.size());

  rep.status = protocol_.start_transmission();
  rep.mode = protocol_.mode();
  if (!rep.ok()) return rep;

  {
    std::ostringstream line;
    line << "writing " << rep.packet_count << " packets to address 0x"
         << std::hex << target_address;
    log_.info(line.str());
  }

  if (!send(Packet(0x0000, metadata_payload(target_address, rep.packet_count)), rep)) return rep;

  for (uint32_t i = 0; i < rep.packet_count; ++i) {
    const std::size_t off = static_cast<std::size_t>(i) * Packet::MAX_SIZE;
    const std::size_t len = std::min(Packet::MAX_SIZE, data.size() - off);

    log_.info("sending packet " + std::to_string(i + 1) + " of " + std::to_string(rep.packet_count));
    // Block ids are 16 bits on the wire; beyond 65535 packets they wrap.
    Packet pkt(static_cast<uint16_t>(i + 1), data.data() + off, len);
    if (!send(pkt, rep)) return rep;
    rep.bytes_sent += len;
  }

  rep.status = protocol_.stop_transmission();
  return rep;
}

} // namespace bitflash
