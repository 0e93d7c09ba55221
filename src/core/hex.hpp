/**
 * @file hex.hpp
 * @brief Преобразование байт в hex строку и обратно
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace btcaddr {

/**
 * @brief Преобразовать байты в hex строку (нижний регистр, порядок как в памяти)
 */
[[nodiscard]] std::string to_hex(ByteSpan data);

/**
 * @brief Разобрать hex строку
 *
 * @return Result<Bytes> Байты или InvalidCharacter / TooShort при нечётной длине
 */
[[nodiscard]] Result<Bytes> from_hex(std::string_view hex);

} // namespace btcaddr
