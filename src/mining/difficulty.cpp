/**
 * @file difficulty.cpp
 * @brief Реализация квот сложности
 */

#include "difficulty.hpp"

#include <algorithm>

namespace phlop::mining {

TargetTable Quota::targets() const noexcept {
    TargetTable table{};
    for (std::size_t i = 0; i < table.size(); ++i) {
        table[i] = target_for(i);
    }
    return table;
}

Quota quota_for_block(uint32_t block_index) noexcept {
    constexpr auto players = static_cast<uint32_t>(constants::VIRTUAL_PLAYERS);

    Quota quota;
    quota.block_index = block_index;
    quota.high_players = std::min(block_index, players);
    quota.low_players = players - quota.high_players;
    return quota;
}

DifficultyInfo difficulty_info(uint32_t block_index) {
    Quota quota = quota_for_block(block_index);

    DifficultyInfo info;
    info.block_number = block_index;
    info.total_required_wins = quota.min_games();

    if (quota.low_players > 0) {
        info.win_distribution[constants::LOW_TIER_WINS] = quota.low_players;
    }
    if (quota.high_players > 0) {
        info.win_distribution[constants::HIGH_TIER_WINS] = quota.high_players;
    }

    uint64_t weighted = 0;
    for (const auto& [wins, count] : info.win_distribution) {
        weighted += static_cast<uint64_t>(wins) * wins * count;
    }
    info.difficulty_score = static_cast<double>(weighted) / 100.0;

    return info;
}

} // namespace phlop::mining
