/**
 * @file test_sha256.cpp
 * @brief Тесты SHA256 и SHA256d
 *
 * Векторы FIPS 180-2 и известные значения двойного хеша.
 */

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "crypto/sha256.hpp"
#include "core/hex.hpp"
#include "core/types.hpp"

namespace btcaddr::tests {

namespace {

ByteSpan as_bytes(std::string_view s) {
    return ByteSpan{reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

std::string sha256_hex(std::string_view s) {
    return to_hex(crypto::sha256(as_bytes(s)));
}

} // anonymous namespace

/**
 * @brief Тест: пустое сообщение
 */
TEST(SHA256Test, EmptyMessage) {
    EXPECT_EQ(sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

/**
 * @brief Тест: "abc"
 */
TEST(SHA256Test, Abc) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

/**
 * @brief Тест: 448 бит - длина не помещается в первый блок
 */
TEST(SHA256Test, FiftySixBytes) {
    EXPECT_EQ(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

/**
 * @brief Тест: 896 бит (два полных блока данных)
 */
TEST(SHA256Test, TwoBlocks) {
    EXPECT_EQ(sha256_hex("abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmn"
                         "hijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu"),
              "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1");
}

/**
 * @brief Тест: миллион символов 'a'
 */
TEST(SHA256Test, MillionA) {
    const std::string msg(1000000, 'a');
    EXPECT_EQ(sha256_hex(msg),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

/**
 * @brief Тест: SHA256d пустого сообщения
 */
TEST(SHA256Test, DoubleHashEmpty) {
    EXPECT_EQ(to_hex(crypto::sha256d(as_bytes(""))),
              "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
}

/**
 * @brief Тест: SHA256d("hello")
 */
TEST(SHA256Test, DoubleHashHello) {
    EXPECT_EQ(to_hex(crypto::sha256d(as_bytes("hello"))),
              "9595c9df90075148eb06860365df33584b75bff782a510c6cd4883a419833d50");
}

/**
 * @brief Тест: SHA256d равен SHA256 от SHA256
 */
TEST(SHA256Test, DoubleHashIsHashOfHash) {
    const auto once = crypto::sha256(as_bytes("btcaddr"));
    EXPECT_EQ(crypto::sha256d(as_bytes("btcaddr")), crypto::sha256(once));
}

} // namespace btcaddr::tests
