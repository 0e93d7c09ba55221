/**
 * @file config.hpp
 * @brief Конфигурация btcaddr
 *
 * Загрузка и парсинг конфигурации из TOML файла. Файл необязателен:
 * без него действуют значения по умолчанию.
 *
 * Пример конфигурации (btcaddr.toml):
 * @code
 * [classifier]
 * require_known_network = false
 *
 * [batch]
 * worker_threads = 0
 *
 * [logging]
 * level = "info"
 * color = true
 * @endcode
 */

#pragma once

#include "types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace btcaddr {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Политика классификатора
 */
struct ClassifierConfig {
    /// @brief Отклонять bech32 адреса с HRP вне bc / tb / bcrt
    bool require_known_network = false;
};

/**
 * @brief Настройки пула потоков пакетной проверки
 */
struct WorkerPoolConfig {
    /// @brief Количество потоков (0 = hardware_concurrency, максимум 256)
    std::size_t worker_threads = 0;
};

/**
 * @brief Настройки вывода
 */
struct LoggingConfig {
    /// @brief Уровень: "error", "warn", "info", "debug"
    std::string level = "info";

    /// @brief ANSI цвета
    bool color = true;
};

/**
 * @brief Полная конфигурация btcaddr
 */
struct Config {
    ClassifierConfig classifier;
    WorkerPoolConfig batch;
    LoggingConfig logging;

    /// @brief Файл, из которого загружена конфигурация (пусто для значений по умолчанию)
    std::optional<std::filesystem::path> source;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     *         (ConfigNotFound, ConfigParseError, ConfigInvalidValue)
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Явно указанный путь обязан существовать. Иначе ищет:
     * 1. ./btcaddr.toml
     * 2. /etc/btcaddr/btcaddr.toml
     * 3. ~/.config/btcaddr/btcaddr.toml
     *
     * Если ни один файл не найден, возвращает значения по умолчанию.
     *
     * @param path Опциональный путь к файлу
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * - worker_threads не больше 256
     * - level из набора error | warn | info | debug
     *
     * @return Result<void> Успех или ConfigInvalidValue
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace btcaddr
