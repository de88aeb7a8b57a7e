#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include "core/Constants.hpp"
#include "core/HasherConfig.hpp"
#include "hasher/CustomHasher.hpp"
#include "hasher/DefaultHasher.hpp"
#include "hasher/HashidsConverter.hpp"
#include "hasher/SecureHasher.hpp"
#include "test_utils.hpp"

using namespace hashid;

namespace {

std::shared_ptr<const ICodec> codec(const std::string& salt, int minLength,
                                    const std::string& alphabet = Constants::DEFAULT_ALPHABET) {
    return std::make_shared<test::utils::FakeCodec>(HasherConfig{salt, minLength, alphabet});
}

uint64_t asNumber(const Decoded& decoded) {
    return std::get<uint64_t>(decoded);
}

}

// Test: Default hasher round trip
TEST(HashersTest, DefaultRoundTrip) {
    DefaultHasher hasher(codec("s", 10));
    auto hash = hasher.encode(123);
    EXPECT_EQ(hash.size(), 10u);
    EXPECT_EQ(asNumber(hasher.decode(hash)), 123u);
    EXPECT_STREQ(hasher.name(), "default");
}

// Test: Numeric strings are encoded like numbers
TEST(HashersTest, NumericStringEncodesAsNumber) {
    DefaultHasher hasher(codec("s", 10));
    EXPECT_EQ(hasher.encode(std::string("123")), hasher.encode(123));
    EXPECT_EQ(hasher.encode("18446744073709551615"), hasher.encode(UINT64_MAX));
}

// Test: Non-numeric input passes through encode unchanged
TEST(HashersTest, EncodePassthrough) {
    DefaultHasher hasher(codec("s", 10));
    EXPECT_EQ(hasher.encode("abc"), "abc");
    EXPECT_EQ(hasher.encode(""), "");
    EXPECT_EQ(hasher.encode("-5"), "-5");
    EXPECT_EQ(hasher.encode("12.5"), "12.5");
    EXPECT_EQ(hasher.encode("18446744073709551616"), "18446744073709551616");
}

// Test: Undecodable input passes through decode unchanged
TEST(HashersTest, DecodePassthrough) {
    DefaultHasher hasher(codec("s", 10));
    for (const std::string input : {"invalid", "", "'; DROP TABLE users; --", "%s%s%n", "zzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzzz"}) {
        Decoded decoded = hasher.decode(input);
        ASSERT_TRUE(std::holds_alternative<std::string>(decoded)) << input;
        EXPECT_EQ(std::get<std::string>(decoded), input);
    }
}

// Test: Secure hasher mixes a timestamp but decodes to the value
TEST(HashersTest, SecureRoundTripDropsTimestamp) {
    SecureHasher hasher(codec("secret", Constants::SECURE_MIN_LENGTH, Constants::SECURE_ALPHABET));
    auto hash = hasher.encode(42);
    EXPECT_GE(hash.size(), static_cast<size_t>(Constants::SECURE_MIN_LENGTH));
    EXPECT_EQ(asNumber(hasher.decode(hash)), 42u);
    EXPECT_EQ(hasher.encode("not a number"), "not a number");
    EXPECT_STREQ(hasher.name(), "secure");
}

// Test: Secure hashes differ from plain codec hashes of the same value
TEST(HashersTest, SecureHashCarriesTwoNumbers) {
    auto shared = codec("secret", 0, Constants::SECURE_ALPHABET);
    SecureHasher secure(shared);
    HashidsConverter plain(shared);
    auto numbers = plain.decodeAll(secure.encode(7));
    ASSERT_EQ(numbers.size(), 2u);
    EXPECT_EQ(numbers[0], 7u);
    EXPECT_GT(numbers[1], 1600000000u);
}

// Test: Custom hasher round trip and defaults
TEST(HashersTest, CustomRoundTrip) {
    CustomHasher hasher(codec("c", Constants::CUSTOM_MIN_LENGTH));
    auto hash = hasher.encode(99);
    EXPECT_EQ(hash.size(), 15u);
    EXPECT_EQ(asNumber(hasher.decode(hash)), 99u);
    EXPECT_EQ(CustomHasher::typeDefaults().minLength, Constants::CUSTOM_MIN_LENGTH);
}

// Test: Type defaults differ per strategy
TEST(HashersTest, TypeDefaults) {
    EXPECT_FALSE(DefaultHasher::typeDefaults().minLength.has_value());
    auto secure = SecureHasher::typeDefaults();
    EXPECT_EQ(secure.minLength, Constants::SECURE_MIN_LENGTH);
    EXPECT_EQ(secure.alphabet, std::string(Constants::SECURE_ALPHABET));
    EXPECT_FALSE(secure.salt.has_value());
}

// Test: Round trip over a range of values for every strategy
TEST(HashersTest, RoundTripAcrossStrategies) {
    auto shared = codec("round trip", 12);
    DefaultHasher def(shared);
    SecureHasher sec(shared);
    CustomHasher cus(shared);
    const std::vector<const IHasher*> hashers{&def, &sec, &cus};
    for (const IHasher* hasher : hashers) {
        for (uint64_t v : {0ULL, 1ULL, 99ULL, 1000000ULL, 4294967296ULL, 18446744073709551615ULL}) {
            EXPECT_EQ(asNumber(hasher->decode(hasher->encode(v))), v) << hasher->name() << " " << v;
        }
    }
}

// Test: Converter handles number lists
TEST(HashersTest, ConverterMultipleNumbers) {
    HashidsConverter converter(codec("this is my salt", 0));
    std::string hash = converter.encodeMany({1, 2, 3});
    EXPECT_EQ(converter.decodeAll(hash), (std::vector<uint64_t>{1, 2, 3}));
    EXPECT_EQ(asNumber(converter.decode(hash)), 1u);
    EXPECT_TRUE(converter.decodeAll("bogus!").empty());
    EXPECT_EQ(converter.encodeMany({}), "");
    EXPECT_STREQ(converter.name(), "hashids");
}

// Test: Hashes from another salt pass through decode
TEST(HashersTest, ForeignSaltPassthrough) {
    DefaultHasher mine(codec("mine", 10));
    DefaultHasher theirs(codec("theirs", 10));
    std::string hash = theirs.encode(12345);
    EXPECT_NE(hash, mine.encode(12345));
    EXPECT_EQ(std::get<std::string>(mine.decode(hash)), hash);
}

// Test: A hasher without a codec is a programming error
TEST(HashersTest, RequiresCodec) {
    EXPECT_THROW(DefaultHasher(nullptr), std::invalid_argument);
}

// Test: Numeric detection
TEST(HashersTest, ParseNumeric) {
    uint64_t out = 0;
    EXPECT_TRUE(IHasher::parseNumeric("0", out));
    EXPECT_EQ(out, 0u);
    EXPECT_TRUE(IHasher::parseNumeric("007", out));
    EXPECT_EQ(out, 7u);
    EXPECT_FALSE(IHasher::parseNumeric("", out));
    EXPECT_FALSE(IHasher::parseNumeric(" 1", out));
    EXPECT_FALSE(IHasher::parseNumeric("1e5", out));
    EXPECT_FALSE(IHasher::parseNumeric("+1", out));
}
