/**
 * @file batch.cpp
 * @brief Реализация пакетного валидатора
 */

#include "batch.hpp"
#include "../core/constants.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <string_view>
#include <thread>

namespace btcaddr::bitcoin {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n\v\f";

std::string_view trim(std::string_view line) noexcept {
    auto first = line.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = line.find_last_not_of(WHITESPACE);
    return line.substr(first, last - first + 1);
}

} // anonymous namespace

// =============================================================================
// Реализация
// =============================================================================

struct BatchValidator::Impl {
    BatchConfig config;

    explicit Impl(const BatchConfig& cfg) : config(cfg) {}

    void worker(std::span<const std::string> addresses,
                std::vector<DecodedAddress>& results,
                std::atomic<std::size_t>& next_index) const {
        for (;;) {
            const std::size_t i = next_index.fetch_add(1, std::memory_order_relaxed);
            if (i >= addresses.size()) {
                return;
            }
            results[i] = classify(addresses[i], config.classifier);
        }
    }
};

BatchValidator::BatchValidator(const BatchConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

BatchValidator::~BatchValidator() = default;

std::size_t BatchValidator::effective_threads(std::size_t input_size) const noexcept {
    std::size_t threads = impl_->config.worker_threads;
    if (threads == 0) {
        threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }
    threads = std::min(threads, constants::MAX_WORKER_THREADS);
    return std::min(threads, input_size);
}

std::vector<DecodedAddress> BatchValidator::run(std::span<const std::string> addresses) const {
    std::vector<DecodedAddress> results(addresses.size());
    const std::size_t threads = effective_threads(addresses.size());
    if (threads == 0) {
        return results;
    }

    std::atomic<std::size_t> next_index{0};

    // Один поток - без лишнего создания std::thread
    if (threads == 1) {
        impl_->worker(addresses, results, next_index);
        return results;
    }

    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) {
        workers.emplace_back([this, addresses, &results, &next_index] {
            impl_->worker(addresses, results, next_index);
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    return results;
}

// =============================================================================
// Итоги и ввод
// =============================================================================

BatchSummary summarize(std::span<const DecodedAddress> results) noexcept {
    BatchSummary summary;
    summary.total = results.size();
    for (const auto& r : results) {
        if (r.is_valid()) {
            ++summary.valid;
        } else {
            ++summary.invalid;
        }
        ++summary.by_type[static_cast<std::size_t>(r.type)];
    }
    return summary;
}

Result<std::vector<std::string>> read_address_list(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<std::vector<std::string>>(
            ErrorCode::SystemIOError,
            "Не удалось открыть файл: " + path.string()
        );
    }

    std::vector<std::string> addresses;
    std::string line;
    while (std::getline(file, line)) {
        auto entry = trim(line);
        if (entry.empty() || entry.front() == '#') {
            continue;
        }
        addresses.emplace_back(entry);
    }

    if (file.bad()) {
        return Err<std::vector<std::string>>(
            ErrorCode::SystemIOError,
            "Ошибка чтения файла: " + path.string()
        );
    }
    return addresses;
}

} // namespace btcaddr::bitcoin
