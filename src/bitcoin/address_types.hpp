/**
 * @file address_types.hpp
 * @brief Модель данных результата проверки адреса
 *
 * AddressType и Network - закрытые перечисления. DecodedAddress -
 * неизменяемое значение, создаваемое заново при каждой проверке и
 * не ссылающееся на входную строку.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace btcaddr::bitcoin {

// =============================================================================
// Типы адресов
// =============================================================================

/**
 * @brief Схема, которой закодирован адрес
 */
enum class AddressType {
    P2PKH,      ///< Legacy, Base58Check, версия 0x00
    P2SH,       ///< Legacy, Base58Check, версия 0x05
    SegwitV0,   ///< Native segwit, Bech32, witness v0
    Taproot,    ///< Bech32m, witness v1
    Invalid     ///< Отказ, причина в DecodedAddress::reason
};

[[nodiscard]] constexpr std::string_view to_string(AddressType type) noexcept {
    switch (type) {
        case AddressType::P2PKH: return "P2PKH";
        case AddressType::P2SH: return "P2SH";
        case AddressType::SegwitV0: return "SegwitV0";
        case AddressType::Taproot: return "Taproot";
        case AddressType::Invalid: return "Invalid";
    }
    return "Invalid";
}

// =============================================================================
// Сети
// =============================================================================

/**
 * @brief Сеть, определённая по HRP (только справочно)
 */
enum class Network {
    Mainnet,    ///< bc
    Testnet,    ///< tb (testnet и signet)
    Regtest,    ///< bcrt
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(Network network) noexcept {
    switch (network) {
        case Network::Mainnet: return "mainnet";
        case Network::Testnet: return "testnet";
        case Network::Regtest: return "regtest";
        case Network::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * @brief Определить сеть по HRP (регистр уже приведён к нижнему)
 */
[[nodiscard]] constexpr Network network_from_hrp(std::string_view hrp) noexcept {
    if (hrp == "bc") return Network::Mainnet;
    if (hrp == "tb") return Network::Testnet;
    if (hrp == "bcrt") return Network::Regtest;
    return Network::Unknown;
}

// =============================================================================
// Результат проверки
// =============================================================================

/**
 * @brief Результат классификации адреса
 *
 * Для валидного адреса reason == ErrorCode::Success.
 * Для Invalid заполнено только поле reason.
 */
struct DecodedAddress {
    /// @brief Схема адреса
    AddressType type = AddressType::Invalid;

    /// @brief Байт версии (Base58Check) или witness версия (segwit)
    uint8_t version = 0;

    /// @brief Хеш (Base58Check) или witness программа (segwit)
    Bytes payload;

    /// @brief Причина отказа
    ErrorCode reason = ErrorCode::NotRecognized;

    /// @brief Сеть
    Network network = Network::Unknown;

    /// @brief HRP в нижнем регистре (пусто для Base58)
    std::string hrp;

    [[nodiscard]] bool is_valid() const noexcept {
        return type != AddressType::Invalid;
    }

    /**
     * @brief Создать результат-отказ
     */
    [[nodiscard]] static DecodedAddress invalid(ErrorCode why) {
        DecodedAddress result;
        result.reason = why;
        return result;
    }
};

/**
 * @brief Короткое описание: "P2PKH" или "Invalid(ChecksumMismatch)"
 */
[[nodiscard]] inline std::string describe(const DecodedAddress& address) {
    if (address.is_valid()) {
        return std::string(to_string(address.type));
    }
    return "Invalid(" + std::string(reason_name(address.reason)) + ")";
}

} // namespace btcaddr::bitcoin
