/**
 * @file batch.hpp
 * @brief Параллельная проверка списка адресов
 *
 * Каждый адрес проверяется независимо. Рабочие потоки берут индексы
 * из общего атомарного счётчика и пишут результат в свою ячейку
 * заранее выделенного вектора, поэтому порядок результатов совпадает
 * с порядком входа.
 */

#pragma once

#include "address.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace btcaddr::bitcoin {

/**
 * @brief Настройки пакетной проверки
 */
struct BatchConfig {
    /// @brief Количество рабочих потоков (0 = hardware_concurrency)
    std::size_t worker_threads = 0;

    /// @brief Политика классификации для каждого адреса
    ClassifierOptions classifier;
};

/**
 * @brief Итоги пакетной проверки
 */
struct BatchSummary {
    std::size_t total = 0;
    std::size_t valid = 0;
    std::size_t invalid = 0;

    /// @brief Счётчики по AddressType (индекс = значение перечисления)
    std::array<std::size_t, 5> by_type{};

    [[nodiscard]] std::size_t count(AddressType type) const noexcept {
        return by_type[static_cast<std::size_t>(type)];
    }
};

/**
 * @brief Пакетный валидатор адресов
 */
class BatchValidator {
public:
    explicit BatchValidator(const BatchConfig& config = {});

    ~BatchValidator();

    BatchValidator(const BatchValidator&) = delete;
    BatchValidator& operator=(const BatchValidator&) = delete;

    /**
     * @brief Проверить все адреса
     *
     * Потоков никогда не больше, чем адресов. Пустой вход даёт
     * пустой результат без запуска потоков.
     *
     * @param addresses Входные строки
     * @return std::vector<DecodedAddress> Результаты в порядке входа
     */
    [[nodiscard]] std::vector<DecodedAddress> run(std::span<const std::string> addresses) const;

    /**
     * @brief Фактическое число потоков для входа заданного размера
     */
    [[nodiscard]] std::size_t effective_threads(std::size_t input_size) const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Подсчитать итоги
 */
[[nodiscard]] BatchSummary summarize(std::span<const DecodedAddress> results) noexcept;

/**
 * @brief Прочитать список адресов из файла
 *
 * Один адрес на строку. Пробелы по краям обрезаются, пустые строки
 * и строки, начинающиеся с '#', пропускаются.
 *
 * @param path Путь к файлу
 * @return Result<std::vector<std::string>> Адреса или SystemIOError
 */
[[nodiscard]] Result<std::vector<std::string>> read_address_list(const std::filesystem::path& path);

} // namespace btcaddr::bitcoin
