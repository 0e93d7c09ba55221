/**
 * @file bech32_checksum.hpp
 * @brief Контрольная сумма Bech32 / Bech32m (BIP-173, BIP-350)
 *
 * Контрольная сумма - остаток BCH кода над GF(32). HRP расширяется
 * в последовательность 5-битных значений, к ней дописываются данные,
 * и polymod прогоняется по всем группам. Строка валидна, если итог
 * равен константе варианта:
 * - Bech32:  1           (witness v0)
 * - Bech32m: 0x2bc830a3  (witness v1+)
 *
 * Варианты не взаимозаменяемы: данные v0 с константой Bech32m
 * (и наоборот) считаются ошибкой контрольной суммы.
 */

#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"

#include <array>
#include <string_view>

namespace btcaddr::bitcoin::bech32 {

/**
 * @brief Вариант контрольной суммы
 */
enum class Variant {
    Bech32,     ///< BIP-173, witness v0
    Bech32m     ///< BIP-350, witness v1..16
};

[[nodiscard]] constexpr std::string_view to_string(Variant variant) noexcept {
    switch (variant) {
        case Variant::Bech32: return "bech32";
        case Variant::Bech32m: return "bech32m";
    }
    return "bech32";
}

/**
 * @brief Итоговая константа polymod для варианта
 */
[[nodiscard]] constexpr uint32_t variant_constant(Variant variant) noexcept {
    switch (variant) {
        case Variant::Bech32: return constants::BECH32_CONST;
        case Variant::Bech32m: return constants::BECH32M_CONST;
    }
    return constants::BECH32_CONST;
}

/**
 * @brief Контрольная сумма: ровно 6 групп по 5 бит
 */
using Checksum = std::array<uint8_t, constants::BECH32_CHECKSUM_SIZE>;

/**
 * @brief Вычисление полиномиальной контрольной суммы
 *
 * @param values 5-битные значения
 * @return Остаток (30 бит)
 */
[[nodiscard]] uint32_t polymod(ByteSpan values) noexcept;

/**
 * @brief Расширение HRP: старшие биты, 0, младшие биты
 */
[[nodiscard]] Bytes hrp_expand(std::string_view hrp);

/**
 * @brief Проверить контрольную сумму
 *
 * @param hrp HRP в нижнем регистре
 * @param data 5-битные группы данных вместе с 6 группами контрольной суммы
 * @param variant Вариант, по константе которого идёт сравнение
 * @return true если итог polymod равен константе варианта
 */
[[nodiscard]] bool verify_checksum(std::string_view hrp, ByteSpan data, Variant variant);

/**
 * @brief Вычислить контрольную сумму для данных без неё
 */
[[nodiscard]] Checksum create_checksum(std::string_view hrp, ByteSpan data, Variant variant);

} // namespace btcaddr::bitcoin::bech32
