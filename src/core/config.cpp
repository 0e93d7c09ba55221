/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "constants.hpp"
#include "../log/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <cstdlib>
#include <vector>

namespace btcaddr {

namespace {

/**
 * @brief Ключ присутствует, но имеет не тот тип
 */
Error wrong_type(std::string_view section, std::string_view key, std::string_view expected) {
    return Error{
        ErrorCode::ConfigInvalidValue,
        "[" + std::string(section) + "]." + std::string(key) + " должен быть " + std::string(expected)
    };
}

} // anonymous namespace

// =============================================================================
// Config - Загрузка из файла
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            "Файл конфигурации не найден: " + path.string()
        );
    }

    try {
        auto table = toml::parse_file(path.string());

        Config config;
        config.source = path;

        // === Секция [classifier] ===
        if (auto classifier = table["classifier"].as_table()) {
            auto node = (*classifier)["require_known_network"];
            if (node) {
                auto val = node.value<bool>();
                if (!val) {
                    return std::unexpected(wrong_type("classifier", "require_known_network", "bool"));
                }
                config.classifier.require_known_network = *val;
            }
        }

        // === Секция [batch] ===
        if (auto batch = table["batch"].as_table()) {
            auto node = (*batch)["worker_threads"];
            if (node) {
                auto val = node.value<int64_t>();
                if (!val) {
                    return std::unexpected(wrong_type("batch", "worker_threads", "целым числом"));
                }
                if (*val < 0) {
                    return Err<Config>(
                        ErrorCode::ConfigInvalidValue,
                        "[batch].worker_threads не может быть отрицательным"
                    );
                }
                config.batch.worker_threads = static_cast<std::size_t>(*val);
            }
        }

        // === Секция [logging] ===
        if (auto logging = table["logging"].as_table()) {
            if (auto node = (*logging)["level"]) {
                auto val = node.value<std::string>();
                if (!val) {
                    return std::unexpected(wrong_type("logging", "level", "строкой"));
                }
                config.logging.level = *val;
            }
            if (auto node = (*logging)["color"]) {
                auto val = node.value<bool>();
                if (!val) {
                    return std::unexpected(wrong_type("logging", "color", "bool"));
                }
                config.logging.color = *val;
            }
        }

        return config;

    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            "Ошибка парсинга TOML: " + std::string(e.description())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    if (path.has_value()) {
        return load(path.value());
    }

    std::vector<std::filesystem::path> search_paths;
    search_paths.emplace_back(constants::DEFAULT_CONFIG_FILE);
    search_paths.push_back(std::filesystem::path("/etc/btcaddr") / constants::DEFAULT_CONFIG_FILE);

    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "btcaddr" / constants::DEFAULT_CONFIG_FILE
        );
    }

    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    // Файл не обязателен
    return Config{};
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (batch.worker_threads > constants::MAX_WORKER_THREADS) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "[batch].worker_threads должен быть от 0 до " +
            std::to_string(constants::MAX_WORKER_THREADS)
        );
    }

    if (auto level = log::parse_level(logging.level); !level) {
        return std::unexpected(level.error());
    }

    return {};
}

} // namespace btcaddr
