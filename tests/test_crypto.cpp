#include <gtest/gtest.h>
#include "crypto.hpp"
#include <string>

// FIPS 180-2 example
TEST(CryptoTest, Sha256KnownVector) {
    EXPECT_EQ(crypto::sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoTest, Sha256EmptyInput) {
    EXPECT_EQ(crypto::sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

// RFC 4231 test case 2
TEST(CryptoTest, HmacSha256KnownVector) {
    EXPECT_EQ(crypto::hmac_sha256_hex("what do ya want for nothing?", "Jefe"),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(CryptoTest, HmacDependsOnKey) {
    const std::string data = "2 + 3 = 5";
    std::string a = crypto::hmac_sha256_hex(data, "secret-a");
    std::string b = crypto::hmac_sha256_hex(data, "secret-b");
    EXPECT_NE(a, b);
    EXPECT_NE(a, crypto::sha256_hex(data));
}

// Lowercase hex, 64 characters
TEST(CryptoTest, HexFormat) {
    std::string plaintext(1000, 'A');
    std::string digest = crypto::hmac_sha256_hex(plaintext, "test-secret");
    EXPECT_EQ(digest.size(), 64u);
    EXPECT_EQ(digest.find_first_not_of("0123456789abcdef"), std::string::npos);
}
