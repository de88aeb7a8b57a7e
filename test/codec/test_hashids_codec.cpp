#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>
#include <vector>
#include "codec/HashidsCodec.hpp"
#include "core/Constants.hpp"
#include "core/HasherConfig.hpp"
#include "core/HasherFactory.hpp"
#include "hasher/HashidsConverter.hpp"

using namespace hashid;

namespace {

const std::string SALT = "this is my salt";

HashidsCodec codec(const std::string& salt, int minLength,
                   const std::string& alphabet = Constants::DEFAULT_ALPHABET) {
    return HashidsCodec(HasherConfig{salt, minLength, alphabet});
}

}

// Test: Reference vectors from the Hashids documentation
TEST(HashidsCodecTest, KnownVectors) {
    auto salted = codec(SALT, 0);
    EXPECT_EQ(salted.encode({1, 2, 3}), "laHquq");
    EXPECT_EQ(salted.encode({12345}), "NkK9");
    EXPECT_EQ(salted.encode({683, 94108, 123, 5}), "aBMswoO2UB3Sj");
    EXPECT_EQ(codec("", 0).encode({1, 2, 3}), "o2fXhV");
    EXPECT_EQ(codec(SALT, 8).encode({1}), "gB0NV05e");
}

// Test: Decode reverses known vectors
TEST(HashidsCodecTest, DecodeKnownVectors) {
    auto salted = codec(SALT, 0);
    EXPECT_EQ(salted.decode("NkK9"), std::vector<uint64_t>{12345});
    EXPECT_EQ(salted.decode("laHquq"), (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_EQ(codec(SALT, 8).decode("gB0NV05e"), std::vector<uint64_t>{1});
}

// Test: Foreign hashes and garbage decode to nothing
TEST(HashidsCodecTest, DecodeRejectsForeignInput) {
    EXPECT_TRUE(codec("other salt", 0).decode("NkK9").empty());

    auto salted = codec(SALT, 0);
    EXPECT_TRUE(salted.decode("").empty());
    EXPECT_TRUE(salted.decode("NkK").empty());
    EXPECT_TRUE(salted.decode("../../etc/passwd").empty());
}

// Test: Full 64-bit range and the symbol alphabet survive a round trip
TEST(HashidsCodecTest, RoundTrips) {
    auto plain = codec("", 0);
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(plain.decode(plain.encode({max})), std::vector<uint64_t>{max});

    auto symbols = codec("x", 20, Constants::SECURE_ALPHABET);
    std::vector<uint64_t> numbers{5, 1700000000};
    auto hash = symbols.encode(numbers);
    EXPECT_EQ(hash.size(), 20u);
    EXPECT_EQ(symbols.decode(hash), numbers);

    EXPECT_EQ(codec(SALT, 10).encode({}), "");
}

// Test: The factory produces library-compatible hashes through the provider
TEST(HashidsCodecTest, FactoryIntegration) {
    HasherFactory factory(HashidsCodec::create, SALT, 0);
    auto converter = factory.createConverter("default");
    EXPECT_EQ(converter->encodeMany({1, 2, 3}), "laHquq");
    EXPECT_EQ(std::get<uint64_t>(converter->decode("NkK9")), 12345u);
    EXPECT_EQ(std::get<std::string>(converter->decode("bogus!")), "bogus!");
}
