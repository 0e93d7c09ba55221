/**
 * @file byte_order.hpp
 * @brief Функции для работы с порядком байт (endianness)
 *
 * SHA256 оперирует 32-битными словами в big-endian порядке,
 * длина сообщения записывается как 64-битное big-endian число.
 *
 * @note Функции не зависят от порядка байт хоста.
 */

#pragma once

#include <cstdint>

namespace btcaddr {

/**
 * @brief Записать uint32_t в big-endian формате
 *
 * @param dest Указатель на буфер (минимум 4 байта)
 * @param value Значение для записи
 */
constexpr void write_be32(uint8_t* dest, uint32_t value) noexcept {
    dest[0] = static_cast<uint8_t>(value >> 24);
    dest[1] = static_cast<uint8_t>(value >> 16);
    dest[2] = static_cast<uint8_t>(value >> 8);
    dest[3] = static_cast<uint8_t>(value);
}

/**
 * @brief Прочитать uint32_t из big-endian буфера
 *
 * @param src Указатель на буфер (минимум 4 байта)
 * @return Значение в формате хоста
 */
[[nodiscard]] constexpr uint32_t read_be32(const uint8_t* src) noexcept {
    return (static_cast<uint32_t>(src[0]) << 24) |
           (static_cast<uint32_t>(src[1]) << 16) |
           (static_cast<uint32_t>(src[2]) << 8) |
           static_cast<uint32_t>(src[3]);
}

/**
 * @brief Записать uint64_t в big-endian формате
 */
constexpr void write_be64(uint8_t* dest, uint64_t value) noexcept {
    write_be32(dest, static_cast<uint32_t>(value >> 32));
    write_be32(dest + 4, static_cast<uint32_t>(value));
}

} // namespace btcaddr
