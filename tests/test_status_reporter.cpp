/**
 * @file test_status_reporter.cpp
 * @brief Тесты журнала событий и сводки состояния
 */

#include <gtest/gtest.h>

#include "log/status_reporter.hpp"
#include "log/logger.hpp"
#include "core/constants.hpp"

#include <string>

namespace phlop::tests {

// =============================================================================
// Тесты конфигурации
// =============================================================================

TEST(LoggingConfigTest, DefaultValues) {
    LoggingConfig config;

    EXPECT_EQ(config.level, "info");
    EXPECT_EQ(config.event_history, 200u);
    EXPECT_TRUE(config.color);
}

// =============================================================================
// Тесты уровней
// =============================================================================

TEST(LogLevelTest, FromString) {
    EXPECT_EQ(log::level_from_string("error").value_or(log::Level::Debug), log::Level::Error);
    EXPECT_EQ(log::level_from_string("warn").value_or(log::Level::Debug), log::Level::Warn);
    EXPECT_EQ(log::level_from_string("info").value_or(log::Level::Debug), log::Level::Info);
    EXPECT_EQ(log::level_from_string("debug").value_or(log::Level::Error), log::Level::Debug);
    EXPECT_FALSE(log::level_from_string("verbose").has_value());
}

TEST(LogLevelTest, SetLevel) {
    auto saved = log::level();

    log::set_level(log::Level::Warn);
    EXPECT_TRUE(log::enabled(log::Level::Error));
    EXPECT_TRUE(log::enabled(log::Level::Warn));
    EXPECT_FALSE(log::enabled(log::Level::Info));

    log::set_level(saved);
}

// =============================================================================
// Тесты EventType
// =============================================================================

TEST(EventTypeTest, ToString) {
    EXPECT_EQ(log::to_string(log::EventType::BLOCK_MINED), "BLOCK_MINED");
    EXPECT_EQ(log::to_string(log::EventType::MINING_FAILED), "MINING_FAILED");
    EXPECT_EQ(log::to_string(log::EventType::TX_ACCEPTED), "TX_ACCEPTED");
    EXPECT_EQ(log::to_string(log::EventType::TX_REJECTED), "TX_REJECTED");
    EXPECT_EQ(log::to_string(log::EventType::CHAIN_VALID), "CHAIN_VALID");
    EXPECT_EQ(log::to_string(log::EventType::CHAIN_INVALID), "CHAIN_INVALID");
    EXPECT_EQ(log::to_string(log::EventType::ERROR), "ERROR");
}

TEST(EventTypeTest, Severity) {
    EXPECT_EQ(log::severity(log::EventType::ERROR), log::Level::Error);
    EXPECT_EQ(log::severity(log::EventType::CHAIN_INVALID), log::Level::Error);
    EXPECT_EQ(log::severity(log::EventType::TX_REJECTED), log::Level::Warn);
    EXPECT_EQ(log::severity(log::EventType::BLOCK_MINED), log::Level::Info);
}

// =============================================================================
// Тесты StatusReporter
// =============================================================================

class StatusReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.color = false;  // Отключаем цвета для тестов
        config_.event_history = 10;
    }

    LoggingConfig config_;
};

/**
 * @brief Тест: добавление событий
 */
TEST_F(StatusReporterTest, AddEvents) {
    log::StatusReporter reporter(config_);

    reporter.log_block_mined(1, "alice", 150, constants::UNITS_PER_PHLOP / 2);
    reporter.log_tx_accepted("alice", "bob", 3 * constants::UNITS_PER_PHLOP);

    auto events = reporter.events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, log::EventType::BLOCK_MINED);
    EXPECT_EQ(events[0].miner, "alice");
    EXPECT_NE(events[0].message.find("Block #1"), std::string::npos);
    EXPECT_NE(events[0].message.find("0.500000000000"), std::string::npos);
    EXPECT_EQ(events[1].type, log::EventType::TX_ACCEPTED);
}

/**
 * @brief Тест: ограничение истории событий
 */
TEST_F(StatusReporterTest, EventHistoryLimit) {
    config_.event_history = 5;
    log::StatusReporter reporter(config_);

    for (int i = 0; i < 10; ++i) {
        reporter.log_event(log::EventType::BLOCK_MINED, "Block " + std::to_string(i));
    }

    auto events = reporter.events();
    EXPECT_EQ(events.size(), 5u);

    // Проверяем что остались последние 5
    EXPECT_NE(events[0].message.find("Block 5"), std::string::npos);
}

/**
 * @brief Тест: события ниже уровня логирования отбрасываются
 */
TEST_F(StatusReporterTest, LevelFilter) {
    config_.level = "warn";
    log::StatusReporter reporter(config_);

    reporter.log_tx_accepted("alice", "bob", 1);
    reporter.log_tx_rejected("Недостаточно средств");
    reporter.log_validation(false, 3, 1);
    reporter.log_validation(true, 3, 0);

    auto events = reporter.events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, log::EventType::TX_REJECTED);
    EXPECT_EQ(events[1].type, log::EventType::CHAIN_INVALID);
}

/**
 * @brief Тест: рендеринг статуса без цветов
 */
TEST_F(StatusReporterTest, RenderStatusPlain) {
    log::StatusReporter reporter(config_);

    log::ChainStatus status;
    status.height = 4;
    status.total_games = 512;
    status.total_supply = 1'500 * constants::UNITS_PER_PHLOP;
    status.next_block = 4;
    status.next_low_players = 96;
    status.next_high_players = 4;
    status.next_min_games = 104;
    reporter.update_chain_status(status);
    reporter.update_block_count("alice", 3);
    reporter.log_mining_failed("bob", 7, "round limit");

    auto output = reporter.render_plain();

    EXPECT_NE(output.find("PHLOPCHAIN NODE"), std::string::npos);
    EXPECT_NE(output.find("Height: 4 blocks"), std::string::npos);
    EXPECT_NE(output.find("Games played: 512"), std::string::npos);
    EXPECT_NE(output.find("Supply: 1500.000000000000 PHLOP"), std::string::npos);
    EXPECT_NE(output.find("Next block #4"), std::string::npos);
    EXPECT_NE(output.find("Min games: 104"), std::string::npos);
    EXPECT_NE(output.find("alice (3 blocks)"), std::string::npos);
    EXPECT_NE(output.find("[MINING_FAILED]"), std::string::npos);

    // Без ANSI кодов
    EXPECT_EQ(output.find("\033["), std::string::npos);
}

/**
 * @brief Тест: пустой репортёр
 */
TEST_F(StatusReporterTest, RenderEmpty) {
    log::StatusReporter reporter(config_);
    auto output = reporter.render_plain();
    EXPECT_NE(output.find("(none)"), std::string::npos);
    EXPECT_NE(output.find("(no events)"), std::string::npos);
}

// =============================================================================
// Форматирование сумм
// =============================================================================

TEST(FormatAmountTest, FixedPoint) {
    EXPECT_EQ(log::format_amount(0), "0.000000000000");
    EXPECT_EQ(log::format_amount(9'900'990'099), "0.009900990099");
    EXPECT_EQ(log::format_amount(constants::UNITS_PER_PHLOP), "1.000000000000");
    EXPECT_EQ(log::format_amount(25 * constants::UNITS_PER_PHLOP + 1), "25.000000000001");
}

} // namespace phlop::tests
