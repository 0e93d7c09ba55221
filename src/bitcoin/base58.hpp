/**
 * @file base58.hpp
 * @brief Base58 кодек (алфавит Bitcoin)
 *
 * Base58 представляет байты как большое число в системе счисления
 * с основанием 58. Алфавит исключает визуально похожие символы
 * (0, O, I, l). Каждый ведущий символ '1' соответствует ведущему
 * нулевому байту.
 */

#pragma once

#include "../core/types.hpp"

#include <string>
#include <string_view>

namespace btcaddr::bitcoin::base58 {

/**
 * @brief Декодировать Base58 строку в байты
 *
 * @param input Base58 строка
 * @return Result<Bytes> Байты или ошибка (Empty, InvalidCharacter)
 */
[[nodiscard]] Result<Bytes> decode(std::string_view input);

/**
 * @brief Закодировать байты в Base58 строку
 *
 * Ведущие нулевые байты становятся ведущими символами '1'.
 */
[[nodiscard]] std::string encode(ByteSpan data);

} // namespace btcaddr::bitcoin::base58
