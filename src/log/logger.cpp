/**
 * @file logger.cpp
 * @brief Реализация консольного логгера
 */

#include "logger.hpp"

#include <iostream>
#include <string>

namespace btcaddr::log {

// =============================================================================
// ANSI коды цветов
// =============================================================================

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* DIM = "\033[2m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

namespace {

constexpr std::string_view tag(Level level) noexcept {
    switch (level) {
        case Level::Error: return "[ERROR]";
        case Level::Warn: return "[WARNING]";
        case Level::Info: return "[INFO]";
        case Level::Debug: return "[DEBUG]";
    }
    return "[INFO]";
}

constexpr const char* color_of(Level level) noexcept {
    switch (level) {
        case Level::Error: return ansi::RED;
        case Level::Warn: return ansi::YELLOW;
        case Level::Info: return ansi::CYAN;
        case Level::Debug: return ansi::DIM;
    }
    return ansi::RESET;
}

} // anonymous namespace

Result<Level> parse_level(std::string_view name) {
    if (name == "error") return Level::Error;
    if (name == "warn") return Level::Warn;
    if (name == "info") return Level::Info;
    if (name == "debug") return Level::Debug;
    return Err<Level>(
        ErrorCode::ConfigInvalidValue,
        "Неизвестный уровень логирования: '" + std::string(name) +
        "' (допустимо: error, warn, info, debug)"
    );
}

Logger::Logger(const LoggerConfig& config)
    : Logger(config, std::cout, std::cerr)
{
}

Logger::Logger(const LoggerConfig& config, std::ostream& out, std::ostream& err)
    : config_(config)
    , out_(out)
    , err_(err)
{
}

void Logger::error(std::string_view message) const { write(Level::Error, message); }
void Logger::warn(std::string_view message) const { write(Level::Warn, message); }
void Logger::info(std::string_view message) const { write(Level::Info, message); }
void Logger::debug(std::string_view message) const { write(Level::Debug, message); }

void Logger::write(Level level, std::string_view message) const {
    if (!enabled(level)) {
        return;
    }

    std::ostream& stream = (level == Level::Error || level == Level::Warn) ? err_ : out_;
    if (config_.color) {
        stream << color_of(level) << tag(level) << ansi::RESET;
    } else {
        stream << tag(level);
    }
    stream << ' ' << message << std::endl;
}

} // namespace btcaddr::log
