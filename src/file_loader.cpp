// ============================================================================
// file_loader.cpp — implementation for file_loader.hpp
// ============================================================================

#include "bitflash/file_loader.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace bitflash {

static void set_err(std::string* err, const char* reason) {
  if (err) *err = reason;
}

std::optional<std::vector<uint8_t>> load_file(const std::string& path, std::string* err) {
  std::error_code ec;
  const auto st = fs::status(path, ec);               // non-throwing; check ec
  if (ec || !fs::exists(st)) { set_err(err, "not_found"); return std::nullopt; }
  if (!fs::is_regular_file(st)) { set_err(err, "not_regular_file"); return std::nullopt; }

  std::ifstream in(path, std::ios::binary);
  if (!in) { set_err(err, "read_failed"); return std::nullopt; }

  std::vector<uint8_t> data;
  const auto size = fs::file_size(path, ec);
  if (!ec) data.reserve(static_cast<std::size_t>(size));

  data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) { set_err(err, "read_failed"); return std::nullopt; }
  return data;
}

} // namespace bitflash
