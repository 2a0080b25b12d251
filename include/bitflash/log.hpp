#pragma once
/**
 * @file log.hpp
 * @brief Leveled line logger for bitflash.
 *
 * Output is one line per event, shell-friendly, in the same `key=value` shape
 * the CLI prints its status lines in:
 *
 *   status=start dev=/dev/ttyACM0 file=top.bin bytes=600
 *   sending packet 1 of 3
 *   frame tx [01,00,01,01,00,...]   (debug only)
 *
 * The logger writes to any std::ostream; tests pass an ostringstream,
 * the CLI passes std::cerr. Log::null() swallows everything.
 */

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace bitflash {

enum class LogLevel : uint8_t { Error=0, Info=1, Debug=2 };

class Log {
public:
  explicit Log(std::ostream& out, LogLevel level = LogLevel::Info)
  : out_(&out), level_(level) {}

  void set_level(LogLevel level) { level_ = level; }
  LogLevel level() const { return level_; }
  bool enabled(LogLevel l) const { return static_cast<uint8_t>(l) <= static_cast<uint8_t>(level_); }

  void error(const std::string& line) { write(LogLevel::Error, line); }
  void info (const std::string& line) { write(LogLevel::Info,  line); }
  void debug(const std::string& line) { write(LogLevel::Debug, line); }

  /// Debug-level hex dump: `frame <note> [01,00,02,...]`. Long frames are elided.
  void frame(const char* note, const uint8_t* data, std::size_t len);

  /// Shared sink that discards output.
  static Log& null();

private:
  void write(LogLevel l, const std::string& line);

  std::ostream* out_;
  LogLevel level_;
};

} // namespace bitflash
