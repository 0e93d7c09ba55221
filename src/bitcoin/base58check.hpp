/**
 * @file base58check.hpp
 * @brief Base58Check: Base58 + 4 байта контрольной суммы SHA256d
 *
 * Формат данных после Base58 декодирования:
 * [версия: 1 байт] [payload: N байт] [checksum: 4 байта]
 * checksum = первые 4 байта SHA256(SHA256(версия || payload)).
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"
#include "address_types.hpp"

#include <array>
#include <string>
#include <string_view>

namespace btcaddr::bitcoin::base58check {

/**
 * @brief Промежуточный результат Base58Check декодирования
 */
struct Base58Payload {
    uint8_t version = 0;
    Bytes hash;
    std::array<uint8_t, constants::BASE58_CHECKSUM_SIZE> checksum{};
};

/**
 * @brief Вычислить контрольную сумму Base58Check
 */
[[nodiscard]] std::array<uint8_t, constants::BASE58_CHECKSUM_SIZE> checksum(ByteSpan versioned_payload) noexcept;

/**
 * @brief Декодировать строку и проверить контрольную сумму
 *
 * @return Result<Base58Payload> Версия, payload и checksum или ошибка
 *         (Empty, InvalidCharacter, TooShort, ChecksumMismatch)
 */
[[nodiscard]] Result<Base58Payload> decode_check(std::string_view input);

/**
 * @brief Проверить legacy адрес
 *
 * После проверки контрольной суммы:
 * - 0x00 -> P2PKH, 0x05 -> P2SH, иначе UnknownVersion
 * - хеш должен быть ровно 20 байт (TooShort / TooLong)
 */
[[nodiscard]] Result<DecodedAddress> validate(std::string_view input);

/**
 * @brief Закодировать версию и payload с контрольной суммой
 */
[[nodiscard]] std::string encode_check(uint8_t version, ByteSpan payload);

} // namespace btcaddr::bitcoin::base58check
