/**
 * @file test_logger.cpp
 * @brief Тесты консольного логгера
 */

#include <gtest/gtest.h>

#include <sstream>

#include "log/logger.hpp"

namespace btcaddr::tests {

using log::Level;
using log::Logger;
using log::LoggerConfig;

/**
 * @brief Тест: разбор уровня
 */
TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(log::parse_level("error").value(), Level::Error);
    EXPECT_EQ(log::parse_level("warn").value(), Level::Warn);
    EXPECT_EQ(log::parse_level("info").value(), Level::Info);
    EXPECT_EQ(log::parse_level("debug").value(), Level::Debug);

    auto bad = log::parse_level("INFO");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::ConfigInvalidValue);
}

/**
 * @brief Тест: префиксы и потоки вывода без цвета
 */
TEST(LoggerTest, PlainOutput) {
    std::ostringstream out;
    std::ostringstream err;
    Logger logger(LoggerConfig{Level::Debug, false}, out, err);

    logger.info("готово");
    logger.debug("детали");
    logger.warn("осторожно");
    logger.error("сбой");

    EXPECT_EQ(out.str(), "[INFO] готово\n[DEBUG] детали\n");
    EXPECT_EQ(err.str(), "[WARNING] осторожно\n[ERROR] сбой\n");
}

/**
 * @brief Тест: сообщения ниже уровня отбрасываются
 */
TEST(LoggerTest, FiltersByLevel) {
    std::ostringstream out;
    std::ostringstream err;
    Logger logger(LoggerConfig{Level::Warn, false}, out, err);

    logger.debug("нет");
    logger.info("нет");
    logger.warn("да");

    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "[WARNING] да\n");
    EXPECT_FALSE(logger.enabled(Level::Info));
    EXPECT_TRUE(logger.enabled(Level::Error));
}

/**
 * @brief Тест: ANSI цвет вокруг префикса
 */
TEST(LoggerTest, ColoredOutput) {
    std::ostringstream out;
    std::ostringstream err;
    Logger logger(LoggerConfig{Level::Info, true}, out, err);

    logger.error("сбой");
    EXPECT_EQ(err.str(), "\033[31m[ERROR]\033[0m сбой\n");
}

} // namespace btcaddr::tests
