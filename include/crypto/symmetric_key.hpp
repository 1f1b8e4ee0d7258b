#ifndef BLOBXFER_SYMMETRIC_KEY_HPP
#define BLOBXFER_SYMMETRIC_KEY_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace blobxfer::crypto {

// 256-bit key for sealing payloads
class SymmetricKey {
public:
  static constexpr size_t KEY_SIZE = 32;

  // ---- CONSTRUCTION ----
  // Throws InitializationError unless bytes holds exactly KEY_SIZE bytes
  explicit SymmetricKey(const std::vector<uint8_t>& bytes);
  // Draws a fresh key from the OpenSSL random generator
  static SymmetricKey generate();
  // Parses 64 hex characters, surrounding whitespace is ignored
  static SymmetricKey from_hex(const std::string& hex);


  // ---- GETTERS ----
  const uint8_t* data() const { return bytes_.data(); }
  size_t size() const { return bytes_.size(); }
  std::string to_hex() const;

  bool operator==(const SymmetricKey& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const SymmetricKey& other) const { return !(*this == other); }

private:
  SymmetricKey() = default;

  std::array<uint8_t, KEY_SIZE> bytes_{};
};

} // namespace blobxfer::crypto

#endif // BLOBXFER_SYMMETRIC_KEY_HPP
