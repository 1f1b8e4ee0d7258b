#include "crypto/symmetric_key.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace blobxfer::crypto {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

SymmetricKey::SymmetricKey(const std::vector<uint8_t>& bytes) {
  if (bytes.size() != KEY_SIZE) {
    throw InitializationError("Invalid key size: " + std::to_string(bytes.size()) +
                              " bytes (expected " + std::to_string(KEY_SIZE) + " bytes)");
  }
  std::copy(bytes.begin(), bytes.end(), bytes_.begin());
}

SymmetricKey SymmetricKey::generate() {
  SymmetricKey key;
  if (RAND_bytes(key.bytes_.data(), static_cast<int>(key.bytes_.size())) != 1) {
    throw InitializationError("Failed to generate random key");
  }
  return key;
}

SymmetricKey SymmetricKey::from_hex(const std::string& hex) {
  auto first = std::find_if_not(hex.begin(), hex.end(), [](unsigned char c) { return std::isspace(c); });
  auto last = std::find_if_not(hex.rbegin(), hex.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  std::string trimmed = first < last ? std::string(first, last) : std::string();

  if (trimmed.size() != KEY_SIZE * 2) {
    throw InitializationError("Hex key must have " + std::to_string(KEY_SIZE * 2) + " characters");
  }

  std::vector<uint8_t> bytes(KEY_SIZE);
  for (size_t i = 0; i < KEY_SIZE; ++i) {
    int high = hex_value(trimmed[2 * i]);
    int low = hex_value(trimmed[2 * i + 1]);
    if (high < 0 || low < 0) {
      throw InitializationError("Hex key contains a non-hex character");
    }
    bytes[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return SymmetricKey(bytes);
}

std::string SymmetricKey::to_hex() const {
  std::stringstream ss;
  for (uint8_t byte : bytes_) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace blobxfer::crypto
