#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace blobxfer {
namespace utils {

// ---- NAMES ----
// Lowercase hex of `bytes` bytes from OpenSSL's RNG, throws
// std::filesystem::filesystem_error when the RNG fails
std::string random_hex(size_t bytes);


// ---- DIRECTORIES ----
// Creates a fresh owner-only directory named <prefix><random hex> under root.
// Throws std::filesystem::filesystem_error.
std::filesystem::path create_private_directory(const std::filesystem::path& root,
                                               const std::string& prefix);

// Removes path recursively, logging instead of throwing. Returns true when
// nothing is left at path.
bool remove_all_quietly(const std::filesystem::path& path, const std::string& component);


// ---- WHOLE FILE IO ----
// Both throw std::filesystem::filesystem_error carrying the path and OS error
std::vector<uint8_t> read_file(const std::filesystem::path& path);
void write_file(const std::filesystem::path& path, const std::vector<uint8_t>& data);


// ---- ERROR FORMATTING ----
// "<operation> '<path>': <OS message>"
std::string describe_filesystem_error(const std::string& operation,
                                      const std::filesystem::filesystem_error& error);

} // namespace utils
} // namespace blobxfer
