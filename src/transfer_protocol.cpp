// ============================================================================
// transfer_protocol.cpp — implementation for transfer_protocol.hpp
// ============================================================================

#include "bitflash/transfer_protocol.hpp"

#include <string>

namespace bitflash {

using transport::RxResult;

static LinkStatus from_rx(RxResult r) {
  switch (r) {
    case RxResult::Ok:      return LinkStatus::Ok;
    case RxResult::Timeout: return LinkStatus::Timeout;
    case RxResult::Error:   break;
  }
  return LinkStatus::Error;
}

const char* to_string(LinkStatus s) {
  switch (s) {
    case LinkStatus::Ok:      return "ok";
    case LinkStatus::Nak:     return "nak";
    case LinkStatus::Timeout: return "timeout";
    case LinkStatus::Error:   return "transport_error";
  }
  return "unknown";
}

const char* to_string(Mode m) {
  switch (m) {
    case Mode::Unset:    return "unset";
    case Mode::Crc:      return "crc";
    case Mode::Checksum: return "checksum";
  }
  return "unknown";
}

int exit_code(LinkStatus s) {
  switch (s) {
    case LinkStatus::Ok:      return 0;
    case LinkStatus::Timeout: return 3;
    case LinkStatus::Error:   return 4;
    case LinkStatus::Nak:     return 5;
  }
  return 4;
}

TransferProtocol::TransferProtocol(transport::IByteStream& stream, Log& log)
    : stream_(stream), log_(log) {}

LinkStatus TransferProtocol::write_bytes(const std::vector<uint8_t>& bytes) {
  if (log_.enabled(LogLevel::Debug)) {
    if (auto pkt = decode_packet(bytes)) {
      log_.debug("tx packet block=" + std::to_string(pkt->block_id) +
                 " len=" + std::to_string(pkt->payload.size()));
    } else if (bytes.size() == 1) {
      log_.debug(std::string("tx ") + control_name(bytes[0]));
    }
    log_.frame("tx", bytes.data(), bytes.size());
  }
  if (!stream_.write(bytes)) {
    log_.error(std::string("status=error reason=write_failed transport=") + stream_.name());
    return LinkStatus::Error;
  }
  return LinkStatus::Ok;
}

// Read single bytes until one of @p wanted shows up; anything else is noise.
LinkStatus TransferProtocol::wait_for(std::initializer_list<ControlChar> wanted, uint8_t& seen) {
  for (;;) {
    RxResult r = stream_.read(seen);
    if (r != RxResult::Ok) {
      log_.error(std::string("status=error reason=") + to_string(from_rx(r)) + " while=waiting_reply");
      return from_rx(r);
    }
    for (ControlChar c : wanted) {
      if (seen == byte_of(c)) {
        log_.debug(std::string("rx ") + control_name(seen));
        return LinkStatus::Ok;
      }
    }
  }
}

LinkStatus TransferProtocol::start_transmission() {
  LinkStatus s = write_bytes(to_bytes({ControlChar::StartTransmission}));
  if (s != LinkStatus::Ok) return s;

  uint8_t reply = 0;
  s = wait_for({ControlChar::ModeC, ControlChar::Nak}, reply);
  if (s != LinkStatus::Ok) return s;

  mode_ = (reply == byte_of(ControlChar::ModeC)) ? Mode::Crc : Mode::Checksum;
  log_.debug(std::string("handshake mode=") + to_string(mode_));
  return LinkStatus::Ok;
}

LinkStatus TransferProtocol::send_packet(const Packet& packet) {
  LinkStatus s = write_bytes(packet.serialize());
  if (s != LinkStatus::Ok) return s;

  uint8_t reply = 0;
  s = wait_for({ControlChar::Ack, ControlChar::Nak}, reply);
  if (s != LinkStatus::Ok) return s;
  return (reply == byte_of(ControlChar::Ack)) ? LinkStatus::Ok : LinkStatus::Nak;
}

LinkStatus TransferProtocol::stop_transmission() {
  LinkStatus s = write_bytes(to_bytes({ControlChar::EndOfTransmission}));
  if (s != LinkStatus::Ok) return s;

  RxResult r = stream_.read_until(byte_of(ControlChar::Ack));
  if (r != RxResult::Ok) {
    log_.error(std::string("status=error reason=") + to_string(from_rx(r)) + " while=waiting_eot_ack");
    return from_rx(r);
  }
  mode_ = Mode::Unset;
  return LinkStatus::Ok;
}

} // namespace bitflash
