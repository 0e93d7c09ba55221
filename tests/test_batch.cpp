/**
 * @file test_batch.cpp
 * @brief Тесты пакетного валидатора
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "bitcoin/batch.hpp"
#include "bitcoin/segwit.hpp"

namespace btcaddr::tests {

using bitcoin::AddressType;
using bitcoin::BatchConfig;
using bitcoin::BatchValidator;

namespace {

const std::vector<std::string> MIXED_INPUT = {
    "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa",
    "3J98t1WpEZ73CNmQviecrnyiWrnqRhWNLy",
    "bc1qxy2kgdygjrsqtzq2n0yrf2493p83kkfjhx0wlh",
    "bc1p5d7rjq7g6rdk2yhzks9smlaqtedr4dekq08ge8ztwac72sfr9rusxg3297",
    "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNb",
    "bc1QXY2KGDYGJRSQTZQ2N0YRF2493P83KKFJHX0WLH",
    "",
};

const std::vector<AddressType> EXPECTED_TYPES = {
    AddressType::P2PKH,
    AddressType::P2SH,
    AddressType::SegwitV0,
    AddressType::Taproot,
    AddressType::Invalid,
    AddressType::Invalid,
    AddressType::Invalid,
};

BatchConfig with_threads(std::size_t threads) {
    BatchConfig config;
    config.worker_threads = threads;
    return config;
}

} // anonymous namespace

/**
 * @brief Класс тестов с временной директорией
 */
class BatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("btcaddr_batch_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path dir_;
};

/**
 * @brief Тест: порядок результатов совпадает с порядком входа
 */
TEST_F(BatchTest, PreservesInputOrder) {
    for (std::size_t threads : {1u, 2u, 4u, 0u}) {
        BatchValidator validator(with_threads(threads));
        auto results = validator.run(MIXED_INPUT);

        ASSERT_EQ(results.size(), MIXED_INPUT.size());
        for (std::size_t i = 0; i < results.size(); ++i) {
            EXPECT_EQ(results[i].type, EXPECTED_TYPES[i]) << "threads=" << threads << " i=" << i;
        }
        EXPECT_EQ(results[4].reason, ErrorCode::ChecksumMismatch);
        EXPECT_EQ(results[5].reason, ErrorCode::MixedCase);
        EXPECT_EQ(results[6].reason, ErrorCode::Empty);
    }
}

/**
 * @brief Тест: большой вход на нескольких потоках
 */
TEST_F(BatchTest, ManyAddressesManyThreads) {
    std::vector<std::string> input;
    for (int i = 0; i < 1000; ++i) {
        input.push_back(MIXED_INPUT[static_cast<std::size_t>(i) % MIXED_INPUT.size()]);
    }

    BatchValidator validator(with_threads(8));
    auto results = validator.run(input);

    ASSERT_EQ(results.size(), input.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        ASSERT_EQ(results[i].type, EXPECTED_TYPES[i % EXPECTED_TYPES.size()]) << i;
    }
}

/**
 * @brief Тест: потоков не больше, чем адресов
 */
TEST_F(BatchTest, EffectiveThreads) {
    BatchValidator validator(with_threads(16));
    EXPECT_EQ(validator.effective_threads(0), 0u);
    EXPECT_EQ(validator.effective_threads(3), 3u);
    EXPECT_EQ(validator.effective_threads(100), 16u);

    BatchValidator automatic(with_threads(0));
    EXPECT_GE(automatic.effective_threads(1000), 1u);
    EXPECT_LE(automatic.effective_threads(1000), 256u);
}

/**
 * @brief Тест: пустой вход
 */
TEST_F(BatchTest, EmptyInput) {
    BatchValidator validator;
    auto results = validator.run(std::vector<std::string>{});
    EXPECT_TRUE(results.empty());
}

/**
 * @brief Тест: политика классификатора применяется к каждому адресу
 */
TEST_F(BatchTest, AppliesClassifierOptions) {
    BatchConfig config;
    config.worker_threads = 2;
    config.classifier.require_known_network = true;

    auto unknown_hrp = bitcoin::segwit::encode_address("tc", 1, Bytes(32, 0x07));
    ASSERT_TRUE(unknown_hrp.has_value());

    const std::vector<std::string> input = {
        *unknown_hrp,
        "bc1qxy2kgdygjrsqtzq2n0yrf2493p83kkfjhx0wlh",
    };

    BatchValidator validator(config);
    auto results = validator.run(input);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].reason, ErrorCode::UnknownNetwork);
    EXPECT_EQ(results[1].type, AddressType::SegwitV0);
}

/**
 * @brief Тест: итоги
 */
TEST_F(BatchTest, Summary) {
    BatchValidator validator(with_threads(2));
    auto summary = bitcoin::summarize(validator.run(MIXED_INPUT));

    EXPECT_EQ(summary.total, 7u);
    EXPECT_EQ(summary.valid, 4u);
    EXPECT_EQ(summary.invalid, 3u);
    EXPECT_EQ(summary.count(AddressType::P2PKH), 1u);
    EXPECT_EQ(summary.count(AddressType::P2SH), 1u);
    EXPECT_EQ(summary.count(AddressType::SegwitV0), 1u);
    EXPECT_EQ(summary.count(AddressType::Taproot), 1u);
    EXPECT_EQ(summary.count(AddressType::Invalid), 3u);
}

/**
 * @brief Тест: чтение списка адресов
 */
TEST_F(BatchTest, ReadAddressList) {
    auto path = write_file("list.txt",
        "# адреса для проверки\n"
        "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa\n"
        "\n"
        "   bc1qxy2kgdygjrsqtzq2n0yrf2493p83kkfjhx0wlh  \r\n"
        "\t\n"
        "  # отступ перед комментарием\n"
        "3J98t1WpEZ73CNmQviecrnyiWrnqRhWNLy");

    auto list = bitcoin::read_address_list(path);
    ASSERT_TRUE(list.has_value()) << list.error().message;
    ASSERT_EQ(list->size(), 3u);
    EXPECT_EQ((*list)[0], "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa");
    EXPECT_EQ((*list)[1], "bc1qxy2kgdygjrsqtzq2n0yrf2493p83kkfjhx0wlh");
    EXPECT_EQ((*list)[2], "3J98t1WpEZ73CNmQviecrnyiWrnqRhWNLy");
}

/**
 * @brief Тест: отсутствующий файл
 */
TEST_F(BatchTest, ReadMissingFile) {
    auto list = bitcoin::read_address_list(dir_ / "missing.txt");
    ASSERT_FALSE(list.has_value());
    EXPECT_EQ(list.error().code, ErrorCode::SystemIOError);
}

} // namespace btcaddr::tests
