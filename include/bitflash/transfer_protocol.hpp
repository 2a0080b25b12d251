#pragma once
/**
 * @page bf-protocol bitflash Transfer Protocol
 * @file transfer_protocol.hpp
 * @brief Control-character handshake and per-packet acknowledgement over a byte stream.
 *
 * @details
 * SESSION
 * -------
 *   host                               device
 *   '1'  (StartTransmission)  ------>
 *                             <------  'C' or NAK     (mode handshake; other bytes skipped)
 *   frame (block 0, metadata) ------>
 *                             <------  ACK or NAK
 *   frame (block 1..N)        ------>
 *                             <------  ACK or NAK     (one per frame)
 *   EOT                       ------>
 *                             <------  ... ACK        (everything before ACK discarded)
 *
 * State machine: IDLE -> start_transmission() -> MODE_NEGOTIATED
 *                -> N x send_packet() -> stop_transmission() -> IDLE
 *
 * There are no retries here. A NAK is handed back to the caller, which decides
 * whether to continue. CANCEL is part of the vocabulary but is never sent and
 * never acted upon.
 *
 * BLOCKING
 * --------
 * Every wait reads one byte at a time from the stream. With the default
 * transport timeout (WAIT_FOREVER) a silent peer hangs the call. Set a finite
 * timeout on the stream to get LinkStatus::Timeout instead; the framing and
 * handshake logic are the same either way.
 */

#include "bitflash/control_chars.hpp"
#include "bitflash/log.hpp"
#include "bitflash/packet.hpp"
#include "bitflash/transport/transport_base.hpp"

#include <cstdint>
#include <initializer_list>

namespace bitflash {

/// Outcome of one protocol step.
enum class LinkStatus : uint8_t {
  Ok      = 0,  ///< expected reply seen (mode byte, ACK)
  Nak     = 1,  ///< device answered a packet with NAK
  Timeout = 2,  ///< transport read timed out (finite timeouts only)
  Error   = 3   ///< transport read/write failed
};

/// Which handshake reply the device sent after StartTransmission.
enum class Mode : uint8_t {
  Unset    = 0,  ///< no handshake yet (or session closed)
  Crc      = 1,  ///< 'C'
  Checksum = 2   ///< NAK
};

const char* to_string(LinkStatus s);
const char* to_string(Mode m);

/// Process exit code for a finished upload: ok 0, timeout 3, transport error 4, NAK 5.
int exit_code(LinkStatus s);

class TransferProtocol {
public:
  explicit TransferProtocol(transport::IByteStream& stream, Log& log = Log::null());

  /// Send StartTransmission and wait for 'C' or NAK. Records mode().
  LinkStatus start_transmission();

  /// Write one frame and wait for ACK (Ok) or NAK (Nak).
  LinkStatus send_packet(const Packet& packet);

  /// Send EndOfTransmission and discard input up to the next ACK.
  LinkStatus stop_transmission();

  Mode mode() const { return mode_; }

private:
  LinkStatus write_bytes(const std::vector<uint8_t>& bytes);
  LinkStatus wait_for(std::initializer_list<ControlChar> wanted, uint8_t& seen);

  transport::IByteStream& stream_;
  Log& log_;
  Mode mode_{Mode::Unset};
};

} // namespace bitflash
