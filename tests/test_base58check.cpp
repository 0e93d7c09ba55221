/**
 * @file test_base58check.cpp
 * @brief Тесты Base58Check (P2PKH / P2SH)
 */

#include <gtest/gtest.h>

#include <string>

#include "bitcoin/base58check.hpp"
#include "core/constants.hpp"
#include "core/hex.hpp"

namespace btcaddr::tests {

namespace base58check = bitcoin::base58check;

namespace {

constexpr const char* GENESIS_ADDRESS = "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa";
constexpr const char* GENESIS_HASH160 = "62e907b15cbf27d5425399ebf6f0fb50ebb88f18";

Bytes filled(std::size_t size, uint8_t value) {
    return Bytes(size, value);
}

} // anonymous namespace

/**
 * @brief Тест: адрес из genesis блока
 */
TEST(Base58CheckTest, GenesisAddress) {
    auto result = base58check::validate(GENESIS_ADDRESS);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->type, bitcoin::AddressType::P2PKH);
    EXPECT_EQ(result->version, constants::P2PKH_VERSION);
    EXPECT_EQ(result->network, bitcoin::Network::Mainnet);
    EXPECT_EQ(result->reason, ErrorCode::Success);
    EXPECT_EQ(to_hex(result->payload), GENESIS_HASH160);
}

/**
 * @brief Тест: encode_check воспроизводит известный адрес
 */
TEST(Base58CheckTest, EncodeGenesis) {
    auto hash = from_hex(GENESIS_HASH160);
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(base58check::encode_check(constants::P2PKH_VERSION, *hash), GENESIS_ADDRESS);
}

/**
 * @brief Тест: P2SH адрес
 */
TEST(Base58CheckTest, P2SHAddress) {
    auto result = base58check::validate("3J98t1WpEZ73CNmQviecrnyiWrnqRhWNLy");
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->type, bitcoin::AddressType::P2SH);
    EXPECT_EQ(result->version, constants::P2SH_VERSION);
    EXPECT_EQ(result->payload.size(), constants::RIPEMD160_SIZE);
}

/**
 * @brief Тест: версия и хеш восстанавливаются после кодирования
 */
TEST(Base58CheckTest, VersionAndHashRecovered) {
    Bytes hash;
    for (uint8_t i = 0; i < 20; ++i) {
        hash.push_back(static_cast<uint8_t>(i * 13 + 7));
    }

    for (uint8_t version : {constants::P2PKH_VERSION, constants::P2SH_VERSION}) {
        auto address = base58check::encode_check(version, hash);
        auto payload = base58check::decode_check(address);
        ASSERT_TRUE(payload.has_value()) << address;
        EXPECT_EQ(payload->version, version);
        EXPECT_EQ(payload->hash, hash);
    }
}

/**
 * @brief Тест: последний символ изменён - контрольная сумма не сходится
 */
TEST(Base58CheckTest, ChecksumMismatch) {
    auto result = base58check::validate("1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNb");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ChecksumMismatch);
}

/**
 * @brief Тест: контрольная сумма = первые 4 байта SHA256d
 */
TEST(Base58CheckTest, ChecksumOfEmptyPayload) {
    // SHA256d("") = 5df6e0e2...
    auto sum = base58check::checksum(Bytes{});
    EXPECT_EQ(sum[0], 0x5d);
    EXPECT_EQ(sum[1], 0xf6);
    EXPECT_EQ(sum[2], 0xe0);
    EXPECT_EQ(sum[3], 0xe2);
}

/**
 * @brief Тест: меньше 5 байт после декодирования
 */
TEST(Base58CheckTest, TooShortPayload) {
    auto result = base58check::decode_check("1111");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TooShort);
}

/**
 * @brief Тест: корректная контрольная сумма, но неизвестный байт версии
 */
TEST(Base58CheckTest, UnknownVersion) {
    // 0x6f - testnet P2PKH, не поддерживается
    auto address = base58check::encode_check(0x6f, filled(20, 0xab));
    auto result = base58check::validate(address);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::UnknownVersion);
}

/**
 * @brief Тест: хеш не 20 байт
 */
TEST(Base58CheckTest, WrongHashLength) {
    auto short_address = base58check::encode_check(constants::P2PKH_VERSION, filled(19, 0x11));
    auto short_result = base58check::validate(short_address);
    ASSERT_FALSE(short_result.has_value());
    EXPECT_EQ(short_result.error().code, ErrorCode::TooShort);

    auto long_address = base58check::encode_check(constants::P2SH_VERSION, filled(21, 0x11));
    auto long_result = base58check::validate(long_address);
    ASSERT_FALSE(long_result.has_value());
    EXPECT_EQ(long_result.error().code, ErrorCode::TooLong);
}

/**
 * @brief Тест: ошибки Base58 пробрасываются без изменений
 */
TEST(Base58CheckTest, PropagatesBase58Errors) {
    auto empty = base58check::validate("");
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, ErrorCode::Empty);

    auto bad_char = base58check::validate("1A1zP1eP5QGefi2DMPTfTL5SLmv7Divf0a");
    ASSERT_FALSE(bad_char.has_value());
    EXPECT_EQ(bad_char.error().code, ErrorCode::InvalidCharacter);
}

} // namespace btcaddr::tests
