#pragma once
/**
 * @file file_loader.hpp
 * @brief Read a whole bitstream file into memory before a transfer starts.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bitflash {

/**
 * @brief Load every byte of @p path.
 *
 * @param err  If non-null, receives a short reason token on failure
 *             ("not_found", "not_regular_file", "read_failed").
 * @return File contents, or std::nullopt if the file cannot be read.
 *         An existing empty file yields an empty vector, not nullopt.
 */
std::optional<std::vector<uint8_t>> load_file(const std::string& path, std::string* err = nullptr);

} // namespace bitflash
