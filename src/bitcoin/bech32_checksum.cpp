/**
 * @file bech32_checksum.cpp
 * @brief Реализация контрольной суммы Bech32 / Bech32m
 */

#include "bech32_checksum.hpp"

namespace btcaddr::bitcoin::bech32 {

uint32_t polymod(ByteSpan values) noexcept {
    uint32_t chk = 1;
    for (auto v : values) {
        uint32_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        for (std::size_t i = 0; i < constants::BECH32_GENERATORS.size(); ++i) {
            if ((top >> i) & 1) {
                chk ^= constants::BECH32_GENERATORS[i];
            }
        }
    }
    return chk;
}

Bytes hrp_expand(std::string_view hrp) {
    Bytes result;
    result.reserve(hrp.size() * 2 + 1);

    // Старшие биты каждого символа
    for (char c : hrp) {
        result.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) >> 5));
    }

    result.push_back(0);

    // Младшие биты каждого символа
    for (char c : hrp) {
        result.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) & 0x1f));
    }

    return result;
}

bool verify_checksum(std::string_view hrp, ByteSpan data, Variant variant) {
    auto values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    return polymod(values) == variant_constant(variant);
}

Checksum create_checksum(std::string_view hrp, ByteSpan data, Variant variant) {
    auto values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    values.insert(values.end(), constants::BECH32_CHECKSUM_SIZE, 0);

    uint32_t mod = polymod(values) ^ variant_constant(variant);

    Checksum result;
    for (std::size_t i = 0; i < result.size(); ++i) {
        result[i] = static_cast<uint8_t>((mod >> (5 * (5 - i))) & 0x1f);
    }
    return result;
}

} // namespace btcaddr::bitcoin::bech32
