/**
 * @file sha256.cpp
 * @brief Программная реализация SHA256
 *
 * Алгоритм соответствует FIPS 180-4.
 */

#include "sha256.hpp"
#include "../core/byte_order.hpp"
#include "../core/constants.hpp"

#include <bit>
#include <cstring>

namespace btcaddr::crypto {

namespace {

// Функции SHA256 (FIPS 180-4, секция 4.1.2)
constexpr uint32_t ch(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (~x & z);
}

constexpr uint32_t maj(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (x & z) ^ (y & z);
}

constexpr uint32_t big_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

constexpr uint32_t big_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

constexpr uint32_t small_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3);
}

constexpr uint32_t small_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10);
}

} // anonymous namespace

// =============================================================================
// SHA256 Transform
// =============================================================================

/**
 * Алгоритм:
 * 1. Подготовка расписания сообщения W[0..63]
 * 2. 64 раунда сжатия над рабочими переменными a-h
 * 3. Добавление результата к состоянию
 */
void sha256_transform(Sha256State& state, const uint8_t* block) noexcept {
    std::array<uint32_t, 64> w{};

    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = read_be32(block + i * 4);
    }
    for (std::size_t i = 16; i < 64; ++i) {
        w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
    }

    Sha256State v = state;

    for (std::size_t i = 0; i < 64; ++i) {
        uint32_t t1 = v[7] + big_sigma1(v[4]) + ch(v[4], v[5], v[6]) + constants::SHA256_K[i] + w[i];
        uint32_t t2 = big_sigma0(v[0]) + maj(v[0], v[1], v[2]);
        v[7] = v[6];
        v[6] = v[5];
        v[5] = v[4];
        v[4] = v[3] + t1;
        v[3] = v[2];
        v[2] = v[1];
        v[1] = v[0];
        v[0] = t1 + t2;
    }

    for (std::size_t i = 0; i < 8; ++i) {
        state[i] += v[i];
    }
}

// =============================================================================
// Полные SHA256 функции
// =============================================================================

Hash256 sha256(ByteSpan data) noexcept {
    Sha256State state = constants::SHA256_INIT;

    const std::size_t len = data.size();
    const uint8_t* ptr = data.data();

    // Полные 64-байтные блоки
    const std::size_t blocks = len / constants::SHA256_BLOCK_SIZE;
    for (std::size_t i = 0; i < blocks; ++i) {
        sha256_transform(state, ptr);
        ptr += constants::SHA256_BLOCK_SIZE;
    }

    // Остаток + padding: максимум 2 блока
    const std::size_t remaining = len % constants::SHA256_BLOCK_SIZE;
    std::array<uint8_t, 2 * constants::SHA256_BLOCK_SIZE> buffer{};
    if (remaining > 0) {
        std::memcpy(buffer.data(), ptr, remaining);
    }
    buffer[remaining] = 0x80;

    // Длина сообщения в битах занимает последние 8 байт
    const std::size_t tail = remaining >= 56 ? 2 * constants::SHA256_BLOCK_SIZE
                                             : constants::SHA256_BLOCK_SIZE;
    write_be64(buffer.data() + tail - 8, static_cast<uint64_t>(len) * 8);

    sha256_transform(state, buffer.data());
    if (tail > constants::SHA256_BLOCK_SIZE) {
        sha256_transform(state, buffer.data() + constants::SHA256_BLOCK_SIZE);
    }

    Hash256 result;
    for (std::size_t i = 0; i < 8; ++i) {
        write_be32(result.data() + i * 4, state[i]);
    }
    return result;
}

Hash256 sha256d(ByteSpan data) noexcept {
    Hash256 first = sha256(data);
    return sha256(ByteSpan(first.data(), first.size()));
}

} // namespace btcaddr::crypto
