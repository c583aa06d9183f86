/**
 * @file difficulty.hpp
 * @brief Квота побед для блока с индексом B
 *
 * 100 виртуальных игроков делятся на два уровня:
 * - low  = max(100 - B, 0) игроков, каждому нужна 1 победа
 * - high = min(B, 100) игроков, каждому нужно 2 победы
 *
 * Минимум игр n = low + 2 * high. После блока 100 квота не растёт
 * (все игроки на уровне 2 побед, n = 200).
 */

#pragma once

#include "../core/constants.hpp"

#include <array>
#include <cstdint>
#include <map>

namespace phlop::mining {

/// @brief Цели побед по игрокам 0..99
using TargetTable = std::array<uint32_t, constants::VIRTUAL_PLAYERS>;

/**
 * @brief Квота для одного блока
 */
struct Quota {
    uint32_t block_index{0};

    /// @brief Игроков с целью 1 победа (индексы 0..low-1)
    uint32_t low_players{0};

    /// @brief Игроков с целью 2 победы (индексы low..99)
    uint32_t high_players{0};

    /**
     * @brief Минимум игр n = сумма целей
     */
    [[nodiscard]] uint64_t min_games() const noexcept {
        return static_cast<uint64_t>(low_players) * constants::LOW_TIER_WINS +
               static_cast<uint64_t>(high_players) * constants::HIGH_TIER_WINS;
    }

    /**
     * @brief Цель побед для игрока
     */
    [[nodiscard]] uint32_t target_for(std::size_t player) const noexcept {
        return player < low_players ? constants::LOW_TIER_WINS : constants::HIGH_TIER_WINS;
    }

    [[nodiscard]] TargetTable targets() const noexcept;

    [[nodiscard]] bool operator==(const Quota&) const = default;
};

/**
 * @brief Вычислить квоту для блока
 */
[[nodiscard]] Quota quota_for_block(uint32_t block_index) noexcept;

/**
 * @brief Сводка сложности для отображения
 */
struct DifficultyInfo {
    uint32_t block_number{0};

    /// @brief Сумма целей всех игроков (= n)
    uint64_t total_required_wins{0};

    /// @brief Цель побед -> число игроков с этой целью
    std::map<uint32_t, uint32_t> win_distribution;

    /// @brief sum(wins^2 * count) / 100
    double difficulty_score{0.0};
};

/**
 * @brief Сводка сложности для блока
 */
[[nodiscard]] DifficultyInfo difficulty_info(uint32_t block_index);

} // namespace phlop::mining
