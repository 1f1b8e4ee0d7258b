#include <gtest/gtest.h>
#include "crypto/symmetric_key.hpp"

using namespace blobxfer::crypto;

TEST(SymmetricKeyTest, GeneratedKeysDiffer) {
    SymmetricKey a = SymmetricKey::generate();
    SymmetricKey b = SymmetricKey::generate();
    EXPECT_EQ(a.size(), SymmetricKey::KEY_SIZE);
    EXPECT_NE(a, b);
}

TEST(SymmetricKeyTest, RejectsWrongSize) {
    EXPECT_THROW(SymmetricKey{std::vector<uint8_t>(16, 0x01)}, InitializationError);
    EXPECT_THROW(SymmetricKey{std::vector<uint8_t>(33, 0x01)}, InitializationError);
    EXPECT_NO_THROW(SymmetricKey{std::vector<uint8_t>(32, 0x01)});
}

TEST(SymmetricKeyTest, HexRoundTrip) {
    SymmetricKey key = SymmetricKey::generate();
    std::string hex = key.to_hex();
    EXPECT_EQ(hex.size(), 64u);
    EXPECT_EQ(SymmetricKey::from_hex(hex), key);
    EXPECT_EQ(SymmetricKey::from_hex("  " + hex + "\n"), key);
}

TEST(SymmetricKeyTest, RejectsMalformedHex) {
    EXPECT_THROW(SymmetricKey::from_hex("abcd"), InitializationError);
    EXPECT_THROW(SymmetricKey::from_hex(std::string(64, 'g')), InitializationError);
}

TEST(SymmetricKeyTest, RawBytesAreKept) {
    std::vector<uint8_t> bytes(32);
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>(i);
    }
    SymmetricKey key(bytes);
    EXPECT_EQ(std::vector<uint8_t>(key.data(), key.data() + key.size()), bytes);
    EXPECT_EQ(key.to_hex().substr(0, 8), "00010203");
}
