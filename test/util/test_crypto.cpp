#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "util/Crypto.hpp"

using namespace hashid;

namespace {
std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}
}

// Test: HMAC-SHA-256 matches RFC 4231 test cases 1 and 2
TEST(CryptoTest, HmacSha256KnownVectors) {
    EXPECT_EQ(Crypto::hmacSha256Hex(std::vector<uint8_t>(20, 0x0b), "Hi There"),
              "b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7");
    EXPECT_EQ(Crypto::hmacSha256Hex(bytes("Jefe"), "what do ya want for nothing?"),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

// Test: Different keys give different MACs for the same data
TEST(CryptoTest, HmacDependsOnKey) {
    EXPECT_NE(Crypto::hmacSha256Hex(bytes("key one"), "data"),
              Crypto::hmacSha256Hex(bytes("key two"), "data"));
}

// Test: Hex encoding is lowercase, two chars per byte
TEST(CryptoTest, ToHex) {
    EXPECT_EQ(Crypto::toHex({0x00, 0x0f, 0xab, 0xff}), "000fabff");
    EXPECT_EQ(Crypto::toHex({}), "");
}

// Test: Random output has the requested size and differs between calls
TEST(CryptoTest, RandomBytes) {
    EXPECT_EQ(Crypto::randomBytes(32).size(), 32u);
    std::string a = Crypto::randomHex(32);
    std::string b = Crypto::randomHex(32);
    EXPECT_EQ(a.size(), 64u);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(a, b);
}
