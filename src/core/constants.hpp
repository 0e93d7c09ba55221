/**
 * @file constants.hpp
 * @brief Константы кодировок Bitcoin адресов
 *
 * Алфавиты, байты версий, границы длин и константы контрольных сумм
 * Base58Check (legacy), Bech32 (BIP-173) и Bech32m (BIP-350).
 *
 * @note Все константы определены как constexpr для compile-time вычислений.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace btcaddr::constants {

// =============================================================================
// Размеры хешей
// =============================================================================

/// @brief Размер блока SHA256 (один transform) в байтах
inline constexpr std::size_t SHA256_BLOCK_SIZE = 64;

/// @brief Размер RIPEMD160 хеша (для P2PKH/P2SH/P2WPKH) в байтах
inline constexpr std::size_t RIPEMD160_SIZE = 20;

// =============================================================================
// Base58 / Base58Check
// =============================================================================

/// @brief Алфавит Base58 (без 0, O, I, l)
inline constexpr std::string_view BASE58_ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

/// @brief Размер контрольной суммы Base58Check в байтах
inline constexpr std::size_t BASE58_CHECKSUM_SIZE = 4;

/// @brief Минимальная длина Base58Check данных: версия + контрольная сумма
inline constexpr std::size_t BASE58CHECK_MIN_SIZE = 1 + BASE58_CHECKSUM_SIZE;

/// @brief Размер декодированного legacy адреса: версия, хеш, контрольная сумма
inline constexpr std::size_t LEGACY_ADDRESS_SIZE = 1 + RIPEMD160_SIZE + BASE58_CHECKSUM_SIZE;

/// @brief Байт версии P2PKH (mainnet, адреса на "1")
inline constexpr uint8_t P2PKH_VERSION = 0x00;

/// @brief Байт версии P2SH (mainnet, адреса на "3")
inline constexpr uint8_t P2SH_VERSION = 0x05;

// =============================================================================
// Bech32 / Bech32m
// =============================================================================

/// @brief Алфавит Bech32 (32 символа, индекс = 5-битное значение)
inline constexpr std::string_view BECH32_CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

/// @brief Разделитель HRP и данных
inline constexpr char BECH32_SEPARATOR = '1';

/// @brief Количество 5-битных групп контрольной суммы
inline constexpr std::size_t BECH32_CHECKSUM_SIZE = 6;

/// @brief Максимальная длина всей строки: HRP, разделитель и данные
inline constexpr std::size_t BECH32_MAX_LENGTH = 83;

/// @brief Минимальный и максимальный код символа
inline constexpr char BECH32_MIN_CHAR = 33;
inline constexpr char BECH32_MAX_CHAR = 126;

/// @brief Генераторы полинома BCH кода
inline constexpr std::array<uint32_t, 5> BECH32_GENERATORS = {
    0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
};

/// @brief Итоговая константа polymod для Bech32 (witness v0)
inline constexpr uint32_t BECH32_CONST = 1;

/// @brief Итоговая константа polymod для Bech32m (witness v1+)
inline constexpr uint32_t BECH32M_CONST = 0x2bc830a3;

// =============================================================================
// Segwit
// =============================================================================

/// @brief Максимальная witness версия
inline constexpr uint8_t MAX_WITNESS_VERSION = 16;

/// @brief Witness версия Taproot
inline constexpr uint8_t TAPROOT_WITNESS_VERSION = 1;

/// @brief Границы длины witness программы в байтах
inline constexpr std::size_t MIN_WITNESS_PROGRAM_SIZE = 2;
inline constexpr std::size_t MAX_WITNESS_PROGRAM_SIZE = 40;

/// @brief Допустимые длины программы witness v0: P2WPKH и P2WSH
inline constexpr std::size_t P2WPKH_PROGRAM_SIZE = 20;
inline constexpr std::size_t P2WSH_PROGRAM_SIZE = 32;

// =============================================================================
// Начальные значения SHA256 (H0-H7)
// =============================================================================

/// @brief Начальные значения хеша SHA256 (FIPS 180-4)
inline constexpr std::array<uint32_t, 8> SHA256_INIT = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

/// @brief Константы раунда SHA256 (первые 32 бита дробной части кубических корней простых чисел)
inline constexpr std::array<uint32_t, 64> SHA256_K = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

// =============================================================================
// Настройки по умолчанию
// =============================================================================

/// @brief Имя файла конфигурации
inline constexpr const char* DEFAULT_CONFIG_FILE = "btcaddr.toml";

/// @brief Верхняя граница числа потоков пакетной проверки
inline constexpr std::size_t MAX_WORKER_THREADS = 256;

} // namespace btcaddr::constants
