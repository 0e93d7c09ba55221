/**
 * @file base58check.cpp
 * @brief Реализация Base58Check
 */

#include "base58check.hpp"
#include "base58.hpp"
#include "../crypto/sha256.hpp"

#include <algorithm>

namespace btcaddr::bitcoin::base58check {

std::array<uint8_t, constants::BASE58_CHECKSUM_SIZE> checksum(ByteSpan versioned_payload) noexcept {
    auto hash = crypto::sha256d(versioned_payload);
    std::array<uint8_t, constants::BASE58_CHECKSUM_SIZE> result;
    std::copy_n(hash.begin(), result.size(), result.begin());
    return result;
}

Result<Base58Payload> decode_check(std::string_view input) {
    auto decoded = base58::decode(input);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }

    const Bytes& bytes = *decoded;
    if (bytes.size() < constants::BASE58CHECK_MIN_SIZE) {
        return Err<Base58Payload>(
            ErrorCode::TooShort,
            "Base58Check данные короче " + std::to_string(constants::BASE58CHECK_MIN_SIZE) + " байт"
        );
    }

    const std::size_t body_size = bytes.size() - constants::BASE58_CHECKSUM_SIZE;
    ByteSpan body(bytes.data(), body_size);

    Base58Payload payload;
    std::copy_n(bytes.begin() + static_cast<std::ptrdiff_t>(body_size),
                constants::BASE58_CHECKSUM_SIZE, payload.checksum.begin());

    if (checksum(body) != payload.checksum) {
        return Err<Base58Payload>(ErrorCode::ChecksumMismatch);
    }

    payload.version = body[0];
    payload.hash.assign(body.begin() + 1, body.end());
    return payload;
}

Result<DecodedAddress> validate(std::string_view input) {
    auto payload = decode_check(input);
    if (!payload) {
        return std::unexpected(payload.error());
    }

    DecodedAddress result;
    switch (payload->version) {
        case constants::P2PKH_VERSION:
            result.type = AddressType::P2PKH;
            break;
        case constants::P2SH_VERSION:
            result.type = AddressType::P2SH;
            break;
        default:
            return Err<DecodedAddress>(
                ErrorCode::UnknownVersion,
                "Неизвестный байт версии: " + std::to_string(payload->version)
            );
    }

    // Усечение или дополнение хеша недопустимо
    if (payload->hash.size() < constants::RIPEMD160_SIZE) {
        return Err<DecodedAddress>(ErrorCode::TooShort, "Хеш короче 20 байт");
    }
    if (payload->hash.size() > constants::RIPEMD160_SIZE) {
        return Err<DecodedAddress>(ErrorCode::TooLong, "Хеш длиннее 20 байт");
    }

    result.version = payload->version;
    result.payload = std::move(payload->hash);
    result.reason = ErrorCode::Success;
    result.network = Network::Mainnet;
    return result;
}

std::string encode_check(uint8_t version, ByteSpan payload) {
    Bytes data;
    data.reserve(1 + payload.size() + constants::BASE58_CHECKSUM_SIZE);
    data.push_back(version);
    data.insert(data.end(), payload.begin(), payload.end());

    auto sum = checksum(data);
    data.insert(data.end(), sum.begin(), sum.end());
    return base58::encode(data);
}

} // namespace btcaddr::bitcoin::base58check
