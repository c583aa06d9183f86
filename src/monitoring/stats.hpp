/**
 * @file stats.hpp
 * @brief Статистика цепи и майнеров
 *
 * Агрегаты вычисляются из блоков цепи:
 * - всего блоков, игр, раундов, выпущенной награды
 * - скорость игр между двумя последними блоками
 * - по майнеру: добытые блоки, награда, игры и история по блокам
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/block.hpp"

#include <chrono>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace phlop::monitoring {

// =============================================================================
// Статистика цепи
// =============================================================================

/**
 * @brief Общая статистика цепи
 */
struct ChainStats {
    uint64_t total_blocks = 0;        ///< Включая genesis
    uint64_t total_games = 0;         ///< Сумма games_played по блокам
    uint64_t total_rounds = 0;
    Amount total_reward = 0;          ///< Выпущено наградами (без genesis)
    std::size_t total_transactions = 0;

    /// @brief Игр в секунду между двумя последними блоками (0 если не определено)
    double games_per_second = 0.0;

    /// @brief Время от genesis до вершины
    std::chrono::seconds chain_age{0};
};

/**
 * @brief Один блок майнера
 */
struct MinedBlockRecord {
    uint32_t index = 0;
    Amount reward = 0;
    uint64_t games = 0;
    uint32_t rounds = 0;
    int64_t timestamp = 0;
};

/**
 * @brief Статистика майнера
 */
struct MinerStats {
    std::string miner;
    uint64_t blocks_mined = 0;
    Amount total_reward = 0;
    uint64_t games_played = 0;
    std::vector<MinedBlockRecord> history;

    /**
     * @brief Среднее число игр на блок (0 если блоков нет)
     */
    [[nodiscard]] double average_games() const noexcept {
        return blocks_mined == 0 ? 0.0
                                 : static_cast<double>(games_played) / static_cast<double>(blocks_mined);
    }
};

/**
 * @brief Вычислить статистику цепи
 */
[[nodiscard]] ChainStats compute_chain_stats(std::span<const core::Block> chain);

/**
 * @brief Вычислить статистику майнера
 */
[[nodiscard]] MinerStats compute_miner_stats(
    std::span<const core::Block> chain,
    std::string_view miner
);

// =============================================================================
// Форматирование
// =============================================================================

/**
 * @brief Форматированная статистика цепи для вывода
 */
[[nodiscard]] std::string format_chain_stats(const ChainStats& stats);

/**
 * @brief Форматировать скорость игр для отображения
 *
 * @param rate Игр в секунду
 * @return std::string Например, "1.50 Kgames/s"
 */
[[nodiscard]] std::string format_games_rate(double rate);

/**
 * @brief Форматировать время для отображения
 *
 * @param seconds Время в секундах
 * @return std::string Форматированная строка (например, "1d 2h 30m")
 */
[[nodiscard]] std::string format_duration(std::chrono::seconds seconds);

} // namespace phlop::monitoring
