/**
 * @file logger.hpp
 * @brief Консольный логгер
 *
 * Строки вида "[INFO] сообщение". Ошибки и предупреждения идут в
 * поток ошибок, остальное в поток вывода. Логгер передаётся явно,
 * глобального состояния нет.
 */

#pragma once

#include "../core/types.hpp"

#include <iosfwd>
#include <string_view>

namespace btcaddr::log {

/**
 * @brief Уровень логирования (по возрастанию подробности)
 */
enum class Level {
    Error,
    Warn,
    Info,
    Debug
};

[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Error: return "error";
        case Level::Warn: return "warn";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
    }
    return "info";
}

/**
 * @brief Разобрать уровень из строки конфигурации
 *
 * @param name "error" | "warn" | "info" | "debug"
 * @return Result<Level> Уровень или ConfigInvalidValue
 */
[[nodiscard]] Result<Level> parse_level(std::string_view name);

/**
 * @brief Настройки логгера
 */
struct LoggerConfig {
    Level level = Level::Info;
    bool color = true;
};

/**
 * @brief Консольный логгер
 */
class Logger {
public:
    /**
     * @brief Создать логгер
     *
     * @param config Уровень и цвет
     * @param out Поток для Info и Debug
     * @param err Поток для Error и Warn
     */
    explicit Logger(const LoggerConfig& config);
    Logger(const LoggerConfig& config, std::ostream& out, std::ostream& err);

    void error(std::string_view message) const;
    void warn(std::string_view message) const;
    void info(std::string_view message) const;
    void debug(std::string_view message) const;

    /**
     * @brief Будет ли выведено сообщение данного уровня
     */
    [[nodiscard]] bool enabled(Level level) const noexcept {
        return static_cast<int>(level) <= static_cast<int>(config_.level);
    }

    [[nodiscard]] const LoggerConfig& config() const noexcept { return config_; }

private:
    void write(Level level, std::string_view message) const;

    LoggerConfig config_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace btcaddr::log
