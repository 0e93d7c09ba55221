/**
 * @file base58.cpp
 * @brief Реализация Base58 кодека
 */

#include "base58.hpp"
#include "../core/constants.hpp"

#include <algorithm>
#include <array>
#include <iterator>

namespace btcaddr::bitcoin::base58 {

namespace {

/// @brief Значение символа в алфавите или -1
constexpr std::array<int8_t, 128> make_decode_table() noexcept {
    std::array<int8_t, 128> table{};
    table.fill(-1);
    for (std::size_t i = 0; i < constants::BASE58_ALPHABET.size(); ++i) {
        table[static_cast<std::size_t>(constants::BASE58_ALPHABET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto DECODE_TABLE = make_decode_table();

} // anonymous namespace

Result<Bytes> decode(std::string_view input) {
    if (input.empty()) {
        return Err<Bytes>(ErrorCode::Empty);
    }

    // Ведущие '1' -> ведущие нулевые байты
    std::size_t zeros = 0;
    while (zeros < input.size() && input[zeros] == constants::BASE58_ALPHABET[0]) {
        ++zeros;
    }
    const auto digits = input.substr(zeros);

    // Число в big-endian, буфер с запасом: log(58) / log(256), округлено вверх
    Bytes number(digits.size() * 733 / 1000 + 1, 0x00);
    std::size_t length = 0;

    for (char c : digits) {
        auto code = static_cast<unsigned char>(c);
        int digit = code < DECODE_TABLE.size() ? DECODE_TABLE[code] : -1;
        if (digit < 0) {
            return Err<Bytes>(
                ErrorCode::InvalidCharacter,
                std::string("Недопустимый символ Base58: '") + c + "'"
            );
        }

        // number = number * 58 + digit, только по значащим байтам
        uint32_t carry = static_cast<uint32_t>(digit);
        std::size_t i = 0;
        for (auto it = number.rbegin(); (carry != 0 || i < length) && it != number.rend(); ++it, ++i) {
            carry += static_cast<uint32_t>(*it) * 58;
            *it = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        length = i;
    }

    auto first = number.end() - static_cast<std::ptrdiff_t>(length);
    first = std::find_if(first, number.end(), [](uint8_t b) { return b != 0; });

    Bytes result;
    result.reserve(zeros + static_cast<std::size_t>(std::distance(first, number.end())));
    result.assign(zeros, 0x00);
    result.insert(result.end(), first, number.end());
    return result;
}

std::string encode(ByteSpan data) {
    auto first_nonzero = std::find_if(data.begin(), data.end(), [](uint8_t b) { return b != 0; });
    auto zeros = static_cast<std::size_t>(std::distance(data.begin(), first_nonzero));

    // Цифры по основанию 58 в big-endian порядке: log(256) / log(58), округлено вверх
    std::vector<uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
    std::size_t length = 0;

    for (auto it = first_nonzero; it != data.end(); ++it) {
        uint32_t carry = *it;
        std::size_t i = 0;
        for (auto d = digits.rbegin(); (carry != 0 || i < length) && d != digits.rend(); ++d, ++i) {
            carry += static_cast<uint32_t>(*d) << 8;
            *d = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = i;
    }

    auto first = digits.end() - static_cast<std::ptrdiff_t>(length);
    first = std::find_if(first, digits.end(), [](uint8_t d) { return d != 0; });

    std::string result(zeros, constants::BASE58_ALPHABET[0]);
    result.reserve(zeros + static_cast<std::size_t>(std::distance(first, digits.end())));
    for (; first != digits.end(); ++first) {
        result.push_back(constants::BASE58_ALPHABET[*first]);
    }
    return result;
}

} // namespace btcaddr::bitcoin::base58
