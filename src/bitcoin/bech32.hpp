/**
 * @file bech32.hpp
 * @brief Bech32 кодек: разбор строки на HRP, данные и контрольную сумму
 *
 * Формат: <hrp> '1' <данные> <6 символов контрольной суммы>
 *
 * Разделителем считается ПОСЛЕДНИЙ символ '1': сам HRP может
 * содержать '1', а алфавит данных - нет.
 *
 * decode() проверяет только структуру. Какой вариант контрольной
 * суммы применять, решает вызывающий код по witness версии.
 */

#pragma once

#include "../core/types.hpp"
#include "bech32_checksum.hpp"

#include <string>
#include <string_view>

namespace btcaddr::bitcoin::bech32 {

/**
 * @brief Результат структурного разбора
 */
struct Bech32Decoded {
    /// @brief HRP в нижнем регистре
    std::string hrp;

    /// @brief 5-битные группы данных без контрольной суммы
    Bytes data;

    /// @brief 6 групп контрольной суммы
    Checksum checksum{};

    /**
     * @brief Данные вместе с контрольной суммой (вход для verify_checksum)
     */
    [[nodiscard]] Bytes data_with_checksum() const;
};

/**
 * @brief Разобрать Bech32/Bech32m строку
 *
 * Порядок проверок:
 * 1. Empty
 * 2. NoSeparator, затем TooLong (> 83 символов вместе с HRP и разделителем)
 * 3. MixedCase
 * 4. InvalidCharacter (символ вне 33..126)
 * 5. TooShort (пустой HRP или меньше 6 символов данных)
 * 6. InvalidCharacter (символ данных вне алфавита)
 */
[[nodiscard]] Result<Bech32Decoded> decode(std::string_view input);

/**
 * @brief Закодировать HRP и 5-битные данные, дописав контрольную сумму
 *
 * @param hrp HRP (приводится к нижнему регистру)
 * @param data 5-битные значения (каждое < 32)
 * @param variant Вариант контрольной суммы
 */
[[nodiscard]] Result<std::string> encode(std::string_view hrp, ByteSpan data, Variant variant);

} // namespace btcaddr::bitcoin::bech32
