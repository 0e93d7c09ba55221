/**
 * @file sha256.hpp
 * @brief SHA256 интерфейс
 *
 * Программная реализация SHA256 (FIPS 180-4) и Double SHA256,
 * которым считается контрольная сумма Base58Check.
 */

#pragma once

#include "../core/types.hpp"

#include <array>
#include <cstdint>

namespace btcaddr::crypto {

/**
 * @brief SHA256 состояние (8 x 32-bit слов)
 */
using Sha256State = std::array<uint32_t, 8>;

/**
 * @brief Функция сжатия SHA256 для одного 64-байтного блока
 *
 * @param state Текущее состояние хеша (будет модифицировано)
 * @param block Указатель на 64 байта данных
 *
 * @warning block должен содержать ровно 64 байта!
 */
void sha256_transform(Sha256State& state, const uint8_t* block) noexcept;

/**
 * @brief Вычислить SHA256 хеш данных произвольной длины
 *
 * @param data Входные данные для хеширования
 * @return Hash256 32-байтный хеш
 */
[[nodiscard]] Hash256 sha256(ByteSpan data) noexcept;

/**
 * @brief Вычислить SHA256d (двойной SHA256) хеш
 *
 * SHA256d = SHA256(SHA256(data)). Первые 4 байта результата
 * являются контрольной суммой Base58Check.
 *
 * @param data Входные данные для хеширования
 * @return Hash256 32-байтный хеш
 */
[[nodiscard]] Hash256 sha256d(ByteSpan data) noexcept;

} // namespace btcaddr::crypto
