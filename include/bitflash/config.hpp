#pragma once
/**
 * @file config.hpp
 * @brief Flasher settings and their JSON file form.
 *
 * A config file is a flat JSON object. Every key is optional; missing keys keep
 * whatever value the FlasherConfig already holds, so layering works as
 * defaults -> file -> command line:
 *
 * @code{.json}
 *   {
 *     "dev": "/dev/serial/by-id/usb-FPGA_Loader-if00",
 *     "baud": 115200,
 *     "boot_delay_ms": 400,
 *     "read_timeout_ms": -1,
 *     "address": "0x03",
 *     "strict": false
 *   }
 * @endcode
 *
 * `address` may be a JSON number or a string in decimal or 0x-hex.
 * Unknown keys are ignored. A known key with the wrong type is an error.
 */

#include "nlohmann/json.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace bitflash {

struct FlasherConfig {
  std::string dev{"/dev/ttyACM0"};
  int baud{115200};
  int boot_delay_ms{400};
  int read_timeout_ms{-1};     // negative: wait forever
  uint32_t address{0x03};
  bool strict{false};
};

/// Which FlasherConfig fields were given explicitly on the command line.
struct ExplicitFields {
  bool dev{false};
  bool baud{false};
  bool boot_delay_ms{false};
  bool read_timeout_ms{false};
  bool address{false};
  bool strict{false};
};

/// Effective config: start from @p base (defaults, or defaults overlaid by a
/// config file) and take each field of @p cli that is marked in @p given.
FlasherConfig layer_config(const FlasherConfig& base, const FlasherConfig& cli,
                           const ExplicitFields& given);

/// Parse "1234" or "0x4D2" (case-insensitive prefix) into a 32-bit address.
/// Signs and leading whitespace are rejected.
std::optional<uint32_t> parse_address(const std::string& text);

/// Overlay the keys present in @p j onto @p cfg. On failure @p cfg is untouched.
bool apply_config_json(const nlohmann::json& j, FlasherConfig& cfg, std::string& err);

/// Read @p path and overlay it onto @p cfg (see apply_config_json()).
bool load_config(const std::string& path, FlasherConfig& cfg, std::string& err);

nlohmann::json config_to_json(const FlasherConfig& cfg);

/// Write @p cfg to @p path via a temp file + rename.
bool save_config(const std::string& path, const FlasherConfig& cfg, std::string& err);

} // namespace bitflash
