#include "crypto/sealed_box.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace blobxfer::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

namespace {

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError("Sealed box: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  EVP_CIPHER_CTX* get() { return ctx; }
};

std::string last_openssl_error() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "no OpenSSL error reported";
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return buffer;
}

} // namespace


//==============================================
// ENCRYPTION
//==============================================

std::vector<uint8_t> SealedBox::seal(const std::vector<uint8_t>& payload, const SymmetricKey& key) {
  BOOST_LOG_TRIVIAL(debug) << "Sealed box: Sealing " << payload.size() << " bytes";

  CipherContext context;
  std::vector<uint8_t> nonce = generate_nonce();

  if (!EVP_EncryptInit_ex(context.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) ||
      !EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) ||
      !EVP_EncryptInit_ex(context.get(), nullptr, nullptr, key.data(), nonce.data())) {
    throw EncryptionError("Failed to initialize cipher: " + last_openssl_error());
  }

  // Layout: nonce || ciphertext || tag
  std::vector<uint8_t> sealed(NONCE_SIZE + payload.size() + TAG_SIZE);
  std::copy(nonce.begin(), nonce.end(), sealed.begin());

  int outlen = 0;
  size_t written = 0;
  if (!payload.empty()) {
    if (!EVP_EncryptUpdate(context.get(), sealed.data() + NONCE_SIZE, &outlen,
                           payload.data(), static_cast<int>(payload.size()))) {
      throw EncryptionError("Failed to encrypt payload: " + last_openssl_error());
    }
    written += static_cast<size_t>(outlen);
  }

  if (!EVP_EncryptFinal_ex(context.get(), sealed.data() + NONCE_SIZE + written, &outlen)) {
    throw EncryptionError("Failed to finalize encryption: " + last_openssl_error());
  }
  written += static_cast<size_t>(outlen);

  if (written != payload.size()) {
    throw EncryptionError("Unexpected ciphertext length " + std::to_string(written));
  }

  if (!EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(TAG_SIZE),
                           sealed.data() + NONCE_SIZE + written)) {
    throw EncryptionError("Failed to read authentication tag: " + last_openssl_error());
  }

  BOOST_LOG_TRIVIAL(debug) << "Sealed box: Produced " << sealed.size() << " byte blob";
  return sealed;
}


//==============================================
// DECRYPTION
//==============================================

std::vector<uint8_t> SealedBox::open(const std::vector<uint8_t>& sealed, const SymmetricKey& key) {
  BOOST_LOG_TRIVIAL(debug) << "Sealed box: Opening " << sealed.size() << " byte blob";

  if (sealed.size() < OVERHEAD) {
    BOOST_LOG_TRIVIAL(error) << "Sealed box: Blob of " << sealed.size()
                             << " bytes is shorter than nonce and tag (" << OVERHEAD << " bytes)";
    throw DecryptionError(DecryptionError::Reason::TRUNCATED, "Sealed blob is truncated");
  }

  const size_t ciphertext_size = sealed.size() - OVERHEAD;
  const uint8_t* nonce = sealed.data();
  const uint8_t* ciphertext = sealed.data() + NONCE_SIZE;
  // The tag is only read by OpenSSL, the cast satisfies the ctrl signature
  uint8_t* tag = const_cast<uint8_t*>(sealed.data() + NONCE_SIZE + ciphertext_size);

  CipherContext context;
  if (!EVP_DecryptInit_ex(context.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) ||
      !EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) ||
      !EVP_DecryptInit_ex(context.get(), nullptr, nullptr, key.data(), nonce)) {
    throw DecryptionError(DecryptionError::Reason::CIPHER, "Failed to initialize cipher: " + last_openssl_error());
  }

  std::vector<uint8_t> plaintext(ciphertext_size);
  int outlen = 0;
  size_t written = 0;
  if (ciphertext_size > 0) {
    if (!EVP_DecryptUpdate(context.get(), plaintext.data(), &outlen,
                           ciphertext, static_cast<int>(ciphertext_size))) {
      throw DecryptionError(DecryptionError::Reason::CIPHER, "Failed to decrypt payload: " + last_openssl_error());
    }
    written += static_cast<size_t>(outlen);
  }

  if (!EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(TAG_SIZE), tag)) {
    throw DecryptionError(DecryptionError::Reason::CIPHER, "Failed to set authentication tag: " + last_openssl_error());
  }

  if (EVP_DecryptFinal_ex(context.get(), plaintext.data() + written, &outlen) <= 0) {
    BOOST_LOG_TRIVIAL(error) << "Sealed box: Authentication tag mismatch";
    throw DecryptionError(DecryptionError::Reason::AUTHENTICATION, "Authentication failed");
  }
  written += static_cast<size_t>(outlen);
  plaintext.resize(written);

  BOOST_LOG_TRIVIAL(debug) << "Sealed box: Recovered " << plaintext.size() << " bytes";
  return plaintext;
}


//==============================================
// HELPERS
//==============================================

std::vector<uint8_t> SealedBox::generate_nonce() {
  std::vector<uint8_t> nonce(NONCE_SIZE);
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    throw EncryptionError("Failed to generate random nonce");
  }
  return nonce;
}

} // namespace blobxfer::crypto
