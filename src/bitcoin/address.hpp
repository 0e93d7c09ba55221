/**
 * @file address.hpp
 * @brief Классификация Bitcoin адресов
 *
 * Поддерживает:
 * - P2PKH (Base58Check, версия 0x00): 1...
 * - P2SH (Base58Check, версия 0x05): 3...
 * - P2WPKH / P2WSH (Bech32, witness v0): bc1q... / tb1q... / bcrt1q...
 * - Taproot (Bech32m, witness v1): bc1p...
 *
 * Тип определяется по структуре и контрольной сумме, а не по первому
 * символу. Единственное место, где ошибки разных схем сводятся
 * к одному Invalid(reason).
 */

#pragma once

#include "address_types.hpp"

#include <string_view>

namespace btcaddr::bitcoin {

/**
 * @brief Политика классификации
 */
struct ClassifierOptions {
    /// @brief Отклонять bech32 адреса с неизвестным HRP (UnknownNetwork)
    bool require_known_network = false;
};

/**
 * @brief Классифицировать адрес
 *
 * Порядок:
 * 1. Base58Check; известная версия -> P2PKH / P2SH сразу
 * 2. Bech32: v0 проверяется только как Bech32, v1+ только как Bech32m
 * 3. v0 -> SegwitV0, v1 -> Taproot, v2..16 -> Invalid(UnsupportedWitnessVersion)
 * 4. Ничего не подошло -> Invalid(NotRecognized)
 *
 * @param address Строка адреса
 * @param options Политика
 * @return DecodedAddress Никогда не бросает, отказ - Invalid с причиной
 */
[[nodiscard]] DecodedAddress classify(std::string_view address, const ClassifierOptions& options = {});

/**
 * @brief Разобрать segwit адрес (Bech32/Bech32m)
 *
 * @return Result<DecodedAddress> SegwitV0 / Taproot или ошибка
 */
[[nodiscard]] Result<DecodedAddress> decode_segwit_address(std::string_view address);

/**
 * @brief Проверить валидность адреса
 *
 * @param address Bitcoin адрес
 * @return true если адрес валиден
 */
[[nodiscard]] bool is_valid_address(std::string_view address);

/**
 * @brief Определить тип сети из адреса
 *
 * @param address Bitcoin адрес
 * @return Network Mainnet для legacy и bc1, Unknown для невалидных
 */
[[nodiscard]] Network get_network_from_address(std::string_view address);

} // namespace btcaddr::bitcoin
