// ============================================================================
// control_chars.cpp — implementation for control_chars.hpp
// ============================================================================

#include "bitflash/control_chars.hpp"

namespace bitflash {

const char* control_name(uint8_t byte) {
  switch (static_cast<ControlChar>(byte)) {
    case ControlChar::StartOfHeader:     return "SOH";
    case ControlChar::EndOfTransmission: return "EOT";
    case ControlChar::Ack:               return "ACK";
    case ControlChar::Nak:               return "NAK";
    case ControlChar::Cancel:            return "CAN";
    case ControlChar::StartTransmission: return "START";
    case ControlChar::ModeC:             return "C";
  }
  return "?";
}

} // namespace bitflash
