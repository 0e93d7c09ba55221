/**
 * @file main.cpp
 * @brief Точка входа btcaddr
 *
 * btcaddr - проверка и классификация Bitcoin адресов:
 * P2PKH, P2SH, SegWit v0 и Taproot.
 *
 * Использование:
 *   btcaddr [options] <address>...
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   -f, --file PATH      Прочитать адреса из файла
 *   -q, --quiet          Ничего не выводить, только код возврата
 *   --strict-network     Отклонять bech32 адреса неизвестной сети
 *   --test-config        Проверить конфигурацию и выйти
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 *
 * Код возврата: 0 - все адреса валидны, 1 - есть невалидные,
 * 2 - ошибка аргументов или конфигурации.
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/hex.hpp"
#include "bitcoin/address.hpp"
#include "bitcoin/batch.hpp"
#include "log/logger.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

constexpr int EXIT_ALL_VALID = 0;
constexpr int EXIT_HAS_INVALID = 1;
constexpr int EXIT_USAGE = 2;

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
btcaddr v)" << VERSION << R"(
Проверка и классификация Bitcoin адресов (P2PKH, P2SH, SegWit v0, Taproot)

ИСПОЛЬЗОВАНИЕ:
    btcaddr [ОПЦИИ] <АДРЕС>...

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (btcaddr.toml)
    -f, --file PATH      Прочитать адреса из файла (один на строку, '#' - комментарий)
    -q, --quiet          Ничего не выводить, только код возврата
    --strict-network     Отклонять bech32 адреса с HRP вне bc / tb / bcrt
    --test-config        Проверить конфигурацию и выйти
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы

КОД ВОЗВРАТА:
    0  все адреса валидны
    1  хотя бы один адрес невалиден
    2  ошибка аргументов или конфигурации

ПРИМЕРЫ:
    btcaddr 1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa
    btcaddr --strict-network -f addresses.txt

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "btcaddr v" << VERSION << std::endl;
}

/**
 * @brief Аргументы командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    std::optional<std::string> address_file;
    std::vector<std::string> addresses;
    bool quiet = false;
    bool strict_network = false;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;

    /// @brief Ошибка разбора (неизвестная опция, нет значения)
    std::optional<std::string> error;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--strict-network") {
            args.strict_network = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if (arg == "-c" || arg == "--config" || arg == "-f" || arg == "--file") {
            if (i + 1 >= argc) {
                args.error = "Опция " + std::string(arg) + " требует значение";
                break;
            }
            if (arg == "-c" || arg == "--config") {
                args.config_path = argv[++i];
            } else {
                args.address_file = argv[++i];
            }
        } else if (arg == "--") {
            for (++i; i < argc; ++i) {
                args.addresses.emplace_back(argv[i]);
            }
        } else if (arg.size() > 1 && arg.front() == '-') {
            args.error = "Неизвестная опция: " + std::string(arg);
            break;
        } else {
            args.addresses.emplace_back(arg);
        }
    }

    return args;
}

/**
 * @brief Вывести результат проверки одного адреса
 */
void print_result(std::string_view address, const btcaddr::bitcoin::DecodedAddress& result) {
    using namespace btcaddr;

    std::cout << "Address: " << address << '\n';
    std::cout << "Type: " << bitcoin::describe(result) << '\n';
    if (result.is_valid()) {
        std::cout << "Network: " << bitcoin::to_string(result.network) << '\n';
        std::cout << "Version: " << static_cast<unsigned>(result.version) << '\n';
        std::cout << "Payload: " << to_hex(result.payload) << '\n';
    }
    std::cout << std::endl;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace btcaddr;

    auto args = parse_args(argc, argv);

    if (args.error) {
        std::cerr << "[ERROR] " << *args.error << std::endl;
        std::cerr << "Используйте --help для справки" << std::endl;
        return EXIT_USAGE;
    }

    if (args.show_help) {
        print_help();
        return EXIT_ALL_VALID;
    }

    if (args.show_version) {
        print_version();
        return EXIT_ALL_VALID;
    }

    // Загружаем конфигурацию
    std::optional<std::filesystem::path> config_path;
    if (args.config_path) {
        config_path = *args.config_path;
    }

    auto config_result = Config::load_with_search(config_path);
    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return EXIT_USAGE;
    }

    Config config = std::move(*config_result);

    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return EXIT_USAGE;
    }

    // validate() уже проверил уровень
    log::LoggerConfig logger_config;
    logger_config.level = log::parse_level(config.logging.level).value_or(log::Level::Info);
    logger_config.color = config.logging.color;
    if (args.quiet) {
        logger_config.level = log::Level::Error;
    }
    log::Logger logger(logger_config);

    if (config.source) {
        logger.debug("Конфигурация загружена из " + config.source->string());
    } else {
        logger.debug("Файл конфигурации не найден, используются значения по умолчанию");
    }

    if (args.test_config) {
        logger.info("Конфигурация валидна");
        return EXIT_ALL_VALID;
    }

    // Собираем адреса
    std::vector<std::string> addresses = std::move(args.addresses);
    if (args.address_file) {
        auto from_file = bitcoin::read_address_list(*args.address_file);
        if (!from_file) {
            logger.error(from_file.error().message);
            return EXIT_USAGE;
        }
        logger.debug("Прочитано адресов из файла: " + std::to_string(from_file->size()));
        addresses.insert(addresses.end(),
                         std::make_move_iterator(from_file->begin()),
                         std::make_move_iterator(from_file->end()));
    }

    if (addresses.empty()) {
        logger.error("Не указано ни одного адреса");
        std::cerr << "Используйте --help для справки" << std::endl;
        return EXIT_USAGE;
    }

    bitcoin::BatchConfig batch_config;
    batch_config.worker_threads = config.batch.worker_threads;
    batch_config.classifier.require_known_network =
        config.classifier.require_known_network || args.strict_network;

    bitcoin::BatchValidator validator(batch_config);
    logger.debug("Потоков проверки: " + std::to_string(validator.effective_threads(addresses.size())));

    auto results = validator.run(addresses);

    if (!args.quiet) {
        for (std::size_t i = 0; i < results.size(); ++i) {
            print_result(addresses[i], results[i]);
            if (!results[i].is_valid()) {
                logger.debug(std::string(to_string(results[i].reason)));
            }
        }
    }

    auto summary = bitcoin::summarize(results);
    if (summary.total > 1) {
        logger.info("Проверено адресов: " + std::to_string(summary.total) +
                    ", валидных: " + std::to_string(summary.valid) +
                    ", невалидных: " + std::to_string(summary.invalid));
    }

    return summary.invalid == 0 ? EXIT_ALL_VALID : EXIT_HAS_INVALID;
}
