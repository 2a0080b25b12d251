// ============================================================================
// log.cpp — implementation for log.hpp
// ============================================================================

#include "bitflash/log.hpp"

#include <iomanip>
#include <ios>

namespace bitflash {

// Frames longer than this are printed as head ... tail.
static constexpr std::size_t DUMP_EDGE = 16;

void Log::write(LogLevel l, const std::string& line) {
  if (!enabled(l)) return;
  *out_ << line << '\n';
  out_->flush();
}

void Log::frame(const char* note, const uint8_t* data, std::size_t len) {
  if (!enabled(LogLevel::Debug)) return;

  std::ios fmt(nullptr);
  fmt.copyfmt(*out_);

  *out_ << "frame " << note << " len=" << len << " [" << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < len; ++i) {
    if (len > 2 * DUMP_EDGE && i == DUMP_EDGE) {
      *out_ << "...,";
      i = len - DUMP_EDGE;
    }
    *out_ << std::setw(2) << static_cast<unsigned>(data[i]);
    if (i != len - 1) *out_ << ',';
  }
  *out_ << "]\n";

  out_->copyfmt(fmt);
  out_->flush();
}

Log& Log::null() {
  static std::ostream sink(nullptr);
  static Log log(sink, LogLevel::Error);
  return log;
}

} // namespace bitflash
