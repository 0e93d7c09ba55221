/**
 * @file test_base58.cpp
 * @brief Тесты Base58 кодека
 */

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "bitcoin/base58.hpp"
#include "core/hex.hpp"

namespace btcaddr::tests {

namespace base58 = bitcoin::base58;

namespace {

/// @brief Пары (hex, base58) из набора векторов Bitcoin Core
const std::vector<std::pair<std::string, std::string>> VECTORS = {
    {"61", "2g"},
    {"626262", "a3gV"},
    {"636363", "aPEr"},
    {"73696d706c792061206c6f6e6720737472696e67", "2cFupjhnEsSn59qHXstmK2ffpLv2"},
    {"00eb15231dfceb60925886b67d065299925915aeb172c06647", "1NS17iag9jJgTHD1VXjvLCEnZuQ3rJDE9L"},
    {"516b6fcd0f", "ABnLTmg"},
    {"bf4f89001e670274dd", "3SEo3LWLoPntC"},
    {"572e4794", "3EFU7m"},
    {"ecac89cad93923c02321", "EJDM8drfXA6uyA"},
    {"10c8511e", "Rt5zm"},
    {"00000000000000000000", "1111111111"},
};

} // anonymous namespace

/**
 * @brief Тест: кодирование известных векторов
 */
TEST(Base58Test, EncodeVectors) {
    for (const auto& [hex, expected] : VECTORS) {
        auto bytes = from_hex(hex);
        ASSERT_TRUE(bytes.has_value()) << hex;
        EXPECT_EQ(base58::encode(*bytes), expected) << hex;
    }
}

/**
 * @brief Тест: декодирование известных векторов
 */
TEST(Base58Test, DecodeVectors) {
    for (const auto& [hex, encoded] : VECTORS) {
        auto decoded = base58::decode(encoded);
        ASSERT_TRUE(decoded.has_value()) << encoded;
        EXPECT_EQ(to_hex(*decoded), hex) << encoded;
    }
}

/**
 * @brief Тест: пустой вход
 */
TEST(Base58Test, EmptyInput) {
    EXPECT_EQ(base58::encode(Bytes{}), "");

    auto decoded = base58::decode("");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, ErrorCode::Empty);
}

/**
 * @brief Тест: каждый ведущий '1' - ровно один нулевой байт
 */
TEST(Base58Test, LeadingOnesBecomeZeroBytes) {
    auto decoded = base58::decode("111z");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->size(), 4u);
    EXPECT_EQ((*decoded)[0], 0x00);
    EXPECT_EQ((*decoded)[1], 0x00);
    EXPECT_EQ((*decoded)[2], 0x00);
    EXPECT_EQ((*decoded)[3], 57);
}

/**
 * @brief Тест: строка только из '1'
 */
TEST(Base58Test, OnlyLeadingOnes) {
    auto decoded = base58::decode("11");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, (Bytes{0x00, 0x00}));
}

/**
 * @brief Тест: длинные значения занимают буфер целиком
 */
TEST(Base58Test, LongValues) {
    const Bytes max_value(256, 0xff);
    auto encoded = base58::encode(max_value);
    auto decoded = base58::decode(encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, max_value);

    // 58^n - 1
    const std::string all_z(500, 'z');
    auto number = base58::decode(all_z);
    ASSERT_TRUE(number.has_value());
    EXPECT_NE(number->front(), 0x00);
    EXPECT_EQ(base58::encode(*number), all_z);
}

/**
 * @brief Тест: символы вне алфавита (0, O, I, l и не-ASCII)
 */
TEST(Base58Test, RejectsCharactersOutsideAlphabet) {
    for (const char* input : {"0", "O", "I", "l", "1A1z0", "abc def", "ab+c", "\xc3\xa9"}) {
        auto decoded = base58::decode(input);
        ASSERT_FALSE(decoded.has_value()) << input;
        EXPECT_EQ(decoded.error().code, ErrorCode::InvalidCharacter) << input;
    }
}

} // namespace btcaddr::tests
