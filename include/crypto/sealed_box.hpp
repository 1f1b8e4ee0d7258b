#ifndef BLOBXFER_SEALED_BOX_HPP
#define BLOBXFER_SEALED_BOX_HPP

#include <cstdint>
#include <vector>
#include "crypto_error.hpp"
#include "symmetric_key.hpp"

namespace blobxfer::crypto {

// ChaCha20-Poly1305 authenticated encryption of whole payloads.
// A sealed blob is laid out as nonce || ciphertext || tag, so it can be
// opened again with nothing but the key.
class SealedBox {
public:
  static constexpr size_t NONCE_SIZE = 12;
  static constexpr size_t TAG_SIZE = 16;
  static constexpr size_t OVERHEAD = NONCE_SIZE + TAG_SIZE;

  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Encrypts payload under a fresh random nonce, throws EncryptionError
  static std::vector<uint8_t> seal(const std::vector<uint8_t>& payload, const SymmetricKey& key);
  // Verifies and decrypts a combined blob, throws DecryptionError
  static std::vector<uint8_t> open(const std::vector<uint8_t>& sealed, const SymmetricKey& key);

private:
  // ---- HELPERS ----
  static std::vector<uint8_t> generate_nonce();
};

} // namespace blobxfer::crypto

#endif // BLOBXFER_SEALED_BOX_HPP
