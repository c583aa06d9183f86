/**
 * @file test_difficulty.cpp
 * @brief Тесты квот сложности
 */

#include <gtest/gtest.h>

#include "mining/difficulty.hpp"
#include "mining/game.hpp"

namespace phlop::tests {

class DifficultyTest : public ::testing::Test {};

/**
 * @brief Тест: блок 1 требует 99 игроков по 1 победе и одного на 2 победы
 */
TEST_F(DifficultyTest, FirstBlock) {
    auto quota = mining::quota_for_block(1);
    EXPECT_EQ(quota.low_players, 99u);
    EXPECT_EQ(quota.high_players, 1u);
    EXPECT_EQ(quota.min_games(), 101u);

    EXPECT_EQ(quota.target_for(0), 1u);
    EXPECT_EQ(quota.target_for(98), 1u);
    EXPECT_EQ(quota.target_for(99), 2u);
}

/**
 * @brief Тест: n растёт на единицу с каждым блоком до 100
 */
TEST_F(DifficultyTest, GrowsLinearly) {
    for (uint32_t b = 1; b <= 100; ++b) {
        auto quota = mining::quota_for_block(b);
        EXPECT_EQ(quota.low_players + quota.high_players, 100u);
        EXPECT_EQ(quota.min_games(), 100u + b) << "block=" << b;
    }
}

/**
 * @brief Тест: после блока 100 квота не меняется
 */
TEST_F(DifficultyTest, PlateauAfterHundred) {
    auto at_100 = mining::quota_for_block(100);
    EXPECT_EQ(at_100.low_players, 0u);
    EXPECT_EQ(at_100.high_players, 100u);
    EXPECT_EQ(at_100.min_games(), 200u);

    auto at_150 = mining::quota_for_block(150);
    EXPECT_EQ(at_150.min_games(), 200u);
    EXPECT_EQ(at_150.targets(), at_100.targets());
}

/**
 * @brief Тест: сумма таблицы целей равна n
 */
TEST_F(DifficultyTest, TargetsSumToMinGames) {
    for (uint32_t b : {1u, 37u, 99u, 250u}) {
        auto quota = mining::quota_for_block(b);
        uint64_t sum = 0;
        for (auto target : quota.targets()) {
            sum += target;
        }
        EXPECT_EQ(sum, quota.min_games());
    }
}

/**
 * @brief Тест: сводка сложности для отображения
 */
TEST_F(DifficultyTest, DifficultyInfo) {
    auto info = mining::difficulty_info(1);
    EXPECT_EQ(info.block_number, 1u);
    EXPECT_EQ(info.total_required_wins, 101u);
    ASSERT_EQ(info.win_distribution.size(), 2u);
    EXPECT_EQ(info.win_distribution.at(1), 99u);
    EXPECT_EQ(info.win_distribution.at(2), 1u);
    EXPECT_DOUBLE_EQ(info.difficulty_score, 1.03);

    auto plateau = mining::difficulty_info(120);
    ASSERT_EQ(plateau.win_distribution.size(), 1u);
    EXPECT_EQ(plateau.win_distribution.at(2), 100u);
    EXPECT_DOUBLE_EQ(plateau.difficulty_score, 4.0);
}

// =============================================================================
// Правила игры
// =============================================================================

/**
 * @brief Тест: камень бьёт ножницы, ножницы бьют бумагу, бумага бьёт камень
 */
TEST(GameTest, Rules) {
    using mining::Move;
    using mining::GameOutcome;

    EXPECT_EQ(mining::play(Move::Rock, Move::Scissors), GameOutcome::Win);
    EXPECT_EQ(mining::play(Move::Scissors, Move::Paper), GameOutcome::Win);
    EXPECT_EQ(mining::play(Move::Paper, Move::Rock), GameOutcome::Win);

    EXPECT_EQ(mining::play(Move::Scissors, Move::Rock), GameOutcome::Loss);
    EXPECT_EQ(mining::play(Move::Rock, Move::Paper), GameOutcome::Loss);

    EXPECT_EQ(mining::play(Move::Rock, Move::Rock), GameOutcome::Tie);
    EXPECT_EQ(mining::play(Move::Paper, Move::Paper), GameOutcome::Tie);
}

} // namespace phlop::tests
