#ifndef BLOBXFER_CRYPTO_ERROR_HPP
#define BLOBXFER_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace blobxfer::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Bad key material or an unavailable random generator
class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError("Key error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Seal failed: " + message) {}
};

class DecryptionError : public CryptoError {
public:
    enum class Reason {
        TRUNCATED,       // Shorter than nonce and tag
        AUTHENTICATION,  // Wrong key or modified blob
        CIPHER           // OpenSSL failure
    };

    DecryptionError(Reason reason, const std::string& message)
        : CryptoError("Open failed: " + message), reason_(reason) {}

    Reason reason() const { return reason_; }

private:
    Reason reason_;
};

} // namespace blobxfer::crypto

#endif // BLOBXFER_CRYPTO_ERROR_HPP
