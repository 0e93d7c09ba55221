/**
 * @file segwit.hpp
 * @brief Извлечение witness версии и программы из 5-битных групп
 *
 * Первая группа - witness версия (0..16), остальные перепаковываются
 * из 5-битных групп в байты. Ограничения (BIP-141, BIP-350):
 * - v0: программа ровно 20 (P2WPKH) или 32 (P2WSH) байта
 * - v1..16: программа от 2 до 40 байт
 * - дополнение при перепаковке: не более 4 бит, все нулевые
 */

#pragma once

#include "../core/types.hpp"

#include <string>
#include <string_view>

namespace btcaddr::bitcoin::segwit {

/**
 * @brief Witness версия и программа
 */
struct SegwitProgram {
    uint8_t witness_version = 0;
    Bytes program;
};

/**
 * @brief Конвертация между группами разной битности
 *
 * @param out Куда дописывать результат
 * @param in Входные группы (каждая < 2^from_bits)
 * @param from_bits Ширина входной группы
 * @param to_bits Ширина выходной группы
 * @param pad Дополнять нулями неполную последнюю группу
 * @return false если значение шире from_bits или (без pad) дополнение
 *         длиннее from_bits бит либо содержит единицы
 */
[[nodiscard]] bool convert_bits(Bytes& out, ByteSpan in, int from_bits, int to_bits, bool pad);

/**
 * @brief Проверить длину программы для witness версии
 */
[[nodiscard]] bool is_valid_program_length(uint8_t witness_version, std::size_t length) noexcept;

/**
 * @brief Извлечь witness версию и программу
 *
 * @param data_groups 5-битные группы без контрольной суммы
 * @return Result<SegwitProgram> Программа или ошибка
 *         (InvalidProgramLength, InvalidWitnessVersion, PaddingError)
 */
[[nodiscard]] Result<SegwitProgram> extract(ByteSpan data_groups);

/**
 * @brief Закодировать segwit адрес
 *
 * v0 кодируется Bech32, v1+ - Bech32m.
 *
 * @param hrp HRP ("bc", "tb", "bcrt")
 * @param witness_version Witness версия (0..16)
 * @param program Witness программа
 */
[[nodiscard]] Result<std::string> encode_address(
    std::string_view hrp,
    uint8_t witness_version,
    ByteSpan program
);

} // namespace btcaddr::bitcoin::segwit
