/**
 * @file types.hpp
 * @brief Базовые типы для btcaddr
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: результат SHA256
 * - Bytes: динамический массив байт
 * - ErrorCode: закрытый набор причин отказа
 * - Result<T>: обёртка std::expected для обработки ошибок
 *
 * @note Ни одна функция декодирования не бросает исключений:
 *       каждый шаг возвращает Result.
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace btcaddr {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Результат SHA256 / SHA256d. Первые 4 байта SHA256d являются
 * контрольной суммой Base58Check.
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Динамический массив байт
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

// =============================================================================
// Коды ошибок
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Закрытый набор: switch по ErrorCode пишется без default,
 * чтобы компилятор предупреждал о пропущенных вариантах.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Структурные ошибки адреса (600-609)
    Empty = 600,
    TooShort = 601,
    TooLong = 602,
    InvalidCharacter = 603,
    MixedCase = 604,
    NoSeparator = 605,

    // Ошибки версий (610-619)
    UnknownVersion = 610,
    UnsupportedWitnessVersion = 611,
    InvalidWitnessVersion = 612,

    // Ошибки segwit программы (620-629)
    InvalidProgramLength = 620,
    PaddingError = 621,

    // Ошибки классификации (630-639)
    NotRecognized = 630,
    UnknownNetwork = 631,

    // Криптографические ошибки (700-799)
    ChecksumMismatch = 700,

    // Системные ошибки (800-899)
    SystemIOError = 800,
};

/**
 * @brief Преобразование кода ошибки в человекочитаемую строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::Empty: return "Пустой адрес";
        case ErrorCode::TooShort: return "Адрес слишком короткий";
        case ErrorCode::TooLong: return "Адрес слишком длинный";
        case ErrorCode::InvalidCharacter: return "Недопустимый символ в адресе";
        case ErrorCode::MixedCase: return "Смешанный регистр в адресе";
        case ErrorCode::NoSeparator: return "Отсутствует разделитель bech32";
        case ErrorCode::UnknownVersion: return "Неизвестный байт версии";
        case ErrorCode::UnsupportedWitnessVersion: return "Неподдерживаемая witness версия";
        case ErrorCode::InvalidWitnessVersion: return "Некорректная witness версия";
        case ErrorCode::InvalidProgramLength: return "Некорректная длина witness программы";
        case ErrorCode::PaddingError: return "Ненулевое дополнение при конвертации битов";
        case ErrorCode::NotRecognized: return "Адрес не распознан";
        case ErrorCode::UnknownNetwork: return "Неизвестная сеть (HRP)";
        case ErrorCode::ChecksumMismatch: return "Неверная контрольная сумма";
        case ErrorCode::SystemIOError: return "Ошибка ввода/вывода";
    }
    return "Неизвестная ошибка";
}

/**
 * @brief Стабильное машинное имя кода ошибки
 *
 * Используется в выводе "Invalid(ChecksumMismatch)" и в тестах.
 */
[[nodiscard]] constexpr std::string_view reason_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "ConfigNotFound";
        case ErrorCode::ConfigParseError: return "ConfigParseError";
        case ErrorCode::ConfigInvalidValue: return "ConfigInvalidValue";
        case ErrorCode::Empty: return "Empty";
        case ErrorCode::TooShort: return "TooShort";
        case ErrorCode::TooLong: return "TooLong";
        case ErrorCode::InvalidCharacter: return "InvalidCharacter";
        case ErrorCode::MixedCase: return "MixedCase";
        case ErrorCode::NoSeparator: return "NoSeparator";
        case ErrorCode::UnknownVersion: return "UnknownVersion";
        case ErrorCode::UnsupportedWitnessVersion: return "UnsupportedWitnessVersion";
        case ErrorCode::InvalidWitnessVersion: return "InvalidWitnessVersion";
        case ErrorCode::InvalidProgramLength: return "InvalidProgramLength";
        case ErrorCode::PaddingError: return "PaddingError";
        case ErrorCode::NotRecognized: return "NotRecognized";
        case ErrorCode::UnknownNetwork: return "UnknownNetwork";
        case ErrorCode::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorCode::SystemIOError: return "SystemIOError";
    }
    return "Unknown";
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected. Сообщение служит
 * только для диагностики, решения принимаются по code.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @code
 * auto decoded = bitcoin::base58::decode("1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa");
 * if (!decoded) {
 *     std::cerr << decoded.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace btcaddr
