// ============================================================================
// config.cpp — implementation for config.hpp
// ============================================================================

#include "bitflash/config.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace bitflash {

std::optional<uint32_t> parse_address(const std::string& text) {
  if (text.empty()) return std::nullopt;

  int base = 10;
  const char* p = text.c_str();
  if (text.size() > 2 && p[0] == '0' && (p[1] == 'x' || p[1] == 'X')) { base = 16; p += 2; }
  // strtoull would skip leading whitespace and accept a sign
  if (*p == '-' || *p == '+' || std::isspace(static_cast<unsigned char>(*p))) return std::nullopt;

  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(p, &end, base);
  if (errno != 0 || end == p || *end != '\0') return std::nullopt;
  if (v > std::numeric_limits<uint32_t>::max()) return std::nullopt;
  return static_cast<uint32_t>(v);
}

FlasherConfig layer_config(const FlasherConfig& base, const FlasherConfig& cli,
                           const ExplicitFields& given) {
  FlasherConfig out = base;
  if (given.dev)             out.dev = cli.dev;
  if (given.baud)            out.baud = cli.baud;
  if (given.boot_delay_ms)   out.boot_delay_ms = cli.boot_delay_ms;
  if (given.read_timeout_ms) out.read_timeout_ms = cli.read_timeout_ms;
  if (given.address)         out.address = cli.address;
  if (given.strict)          out.strict = cli.strict;
  return out;
}

// -- typed field readers; each returns false with err set on a type mismatch --

static bool read_int(const json& j, const char* key, int& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_integer()) { err = std::string("bad_type key=") + key; return false; }
  auto v = it->get<long long>();
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
    err = std::string("out_of_range key=") + key;
    return false;
  }
  out = static_cast<int>(v);
  return true;
}

static bool read_string(const json& j, const char* key, std::string& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) { err = std::string("bad_type key=") + key; return false; }
  out = it->get<std::string>();
  return true;
}

static bool read_bool(const json& j, const char* key, bool& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_boolean()) { err = std::string("bad_type key=") + key; return false; }
  out = it->get<bool>();
  return true;
}

static bool read_address(const json& j, const char* key, uint32_t& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;

  if (it->is_number_unsigned()) {
    auto v = it->get<unsigned long long>();
    if (v > std::numeric_limits<uint32_t>::max()) { err = "out_of_range key=address"; return false; }
    out = static_cast<uint32_t>(v);
    return true;
  }
  if (it->is_string()) {
    auto v = parse_address(it->get<std::string>());
    if (!v) { err = "bad_value key=address"; return false; }
    out = *v;
    return true;
  }
  err = "bad_type key=address";
  return false;
}

bool apply_config_json(const json& j, FlasherConfig& cfg, std::string& err) {
  if (!j.is_object()) { err = "not_an_object"; return false; }

  FlasherConfig tmp = cfg;
  if (!read_string (j, "dev",             tmp.dev,             err)) return false;
  if (!read_int    (j, "baud",            tmp.baud,            err)) return false;
  if (!read_int    (j, "boot_delay_ms",   tmp.boot_delay_ms,   err)) return false;
  if (!read_int    (j, "read_timeout_ms", tmp.read_timeout_ms, err)) return false;
  if (!read_address(j, "address",         tmp.address,         err)) return false;
  if (!read_bool   (j, "strict",          tmp.strict,          err)) return false;

  cfg = tmp;
  return true;
}

bool load_config(const std::string& path, FlasherConfig& cfg, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "config_not_found path=" + path; return false; }

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    err = "config_parse_error path=" + path + " byte=" + std::to_string(e.byte);
    return false;
  }
  return apply_config_json(j, cfg, err);
}

json config_to_json(const FlasherConfig& cfg) {
  json j;
  j["dev"] = cfg.dev;
  j["baud"] = cfg.baud;
  j["boot_delay_ms"] = cfg.boot_delay_ms;
  j["read_timeout_ms"] = cfg.read_timeout_ms;
  j["address"] = cfg.address;
  j["strict"] = cfg.strict;
  return j;
}

bool save_config(const std::string& path, const FlasherConfig& cfg, std::string& err) {
  fs::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
  if (ec) { err = "mkdir_failed path=" + p.parent_path().string(); return false; }

  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) { err = "write_failed path=" + tmp.string(); return false; }
    out << config_to_json(cfg).dump(2) << "\n";
    out.flush();
    if (!out) { err = "write_failed path=" + tmp.string(); return false; }
  }
  fs::rename(tmp, p, ec);
  if (ec) { err = "rename_failed path=" + path; return false; }
  return true;
}

} // namespace bitflash
