/**
 * @file bech32.cpp
 * @brief Реализация Bech32 кодека
 *
 * Bech32 спецификация: BIP-173, BIP-350
 */

#include "bech32.hpp"
#include "../core/constants.hpp"

#include <algorithm>
#include <array>

namespace btcaddr::bitcoin::bech32 {

namespace {

/// @brief Значение символа алфавита (нижний регистр) или -1
constexpr std::array<int8_t, 128> make_charset_rev() noexcept {
    std::array<int8_t, 128> table{};
    table.fill(-1);
    for (std::size_t i = 0; i < constants::BECH32_CHARSET.size(); ++i) {
        table[static_cast<std::size_t>(constants::BECH32_CHARSET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto CHARSET_REV = make_charset_rev();

constexpr char to_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

} // anonymous namespace

Bytes Bech32Decoded::data_with_checksum() const {
    Bytes result;
    result.reserve(data.size() + checksum.size());
    result.insert(result.end(), data.begin(), data.end());
    result.insert(result.end(), checksum.begin(), checksum.end());
    return result;
}

Result<Bech32Decoded> decode(std::string_view input) {
    if (input.empty()) {
        return Err<Bech32Decoded>(ErrorCode::Empty);
    }

    auto sep_pos = input.rfind(constants::BECH32_SEPARATOR);
    if (sep_pos == std::string_view::npos) {
        return Err<Bech32Decoded>(ErrorCode::NoSeparator);
    }

    if (input.size() > constants::BECH32_MAX_LENGTH) {
        return Err<Bech32Decoded>(
            ErrorCode::TooLong,
            "Bech32 строка длиннее " + std::to_string(constants::BECH32_MAX_LENGTH) + " символов"
        );
    }

    bool has_upper = false;
    bool has_lower = false;
    for (char c : input) {
        if (c >= 'A' && c <= 'Z') {
            has_upper = true;
        } else if (c >= 'a' && c <= 'z') {
            has_lower = true;
        }
    }
    if (has_upper && has_lower) {
        return Err<Bech32Decoded>(ErrorCode::MixedCase);
    }

    for (char c : input) {
        if (c < constants::BECH32_MIN_CHAR || c > constants::BECH32_MAX_CHAR) {
            return Err<Bech32Decoded>(
                ErrorCode::InvalidCharacter,
                "Символ вне диапазона 33..126: код " + std::to_string(static_cast<unsigned char>(c))
            );
        }
    }

    if (sep_pos == 0 || sep_pos + 1 + constants::BECH32_CHECKSUM_SIZE > input.size()) {
        return Err<Bech32Decoded>(ErrorCode::TooShort);
    }

    Bech32Decoded result;
    result.hrp.reserve(sep_pos);
    for (char c : input.substr(0, sep_pos)) {
        result.hrp.push_back(to_lower(c));
    }

    Bytes values;
    values.reserve(input.size() - sep_pos - 1);
    for (char c : input.substr(sep_pos + 1)) {
        int value = CHARSET_REV[static_cast<std::size_t>(to_lower(c))];
        if (value < 0) {
            return Err<Bech32Decoded>(
                ErrorCode::InvalidCharacter,
                std::string("Недопустимый символ Bech32: '") + c + "'"
            );
        }
        values.push_back(static_cast<uint8_t>(value));
    }

    const std::size_t data_size = values.size() - constants::BECH32_CHECKSUM_SIZE;
    result.data.assign(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(data_size));
    std::copy(values.begin() + static_cast<std::ptrdiff_t>(data_size), values.end(), result.checksum.begin());
    return result;
}

Result<std::string> encode(std::string_view hrp, ByteSpan data, Variant variant) {
    if (hrp.empty()) {
        return Err<std::string>(ErrorCode::TooShort, "Пустой HRP");
    }
    if (hrp.size() + 1 + data.size() + constants::BECH32_CHECKSUM_SIZE > constants::BECH32_MAX_LENGTH) {
        return Err<std::string>(ErrorCode::TooLong);
    }

    std::string lower_hrp;
    lower_hrp.reserve(hrp.size());
    for (char c : hrp) {
        if (c < constants::BECH32_MIN_CHAR || c > constants::BECH32_MAX_CHAR) {
            return Err<std::string>(ErrorCode::InvalidCharacter, "Недопустимый символ в HRP");
        }
        lower_hrp.push_back(to_lower(c));
    }

    if (std::any_of(data.begin(), data.end(), [](uint8_t v) { return v >= 32; })) {
        return Err<std::string>(ErrorCode::InvalidCharacter, "Значение данных шире 5 бит");
    }

    auto checksum = create_checksum(lower_hrp, data, variant);

    std::string result = lower_hrp;
    result.reserve(lower_hrp.size() + 1 + data.size() + checksum.size());
    result += constants::BECH32_SEPARATOR;
    for (auto v : data) {
        result += constants::BECH32_CHARSET[v];
    }
    for (auto v : checksum) {
        result += constants::BECH32_CHARSET[v];
    }
    return result;
}

} // namespace btcaddr::bitcoin::bech32
