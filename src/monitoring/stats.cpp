/**
 * @file stats.cpp
 * @brief Реализация статистики цепи
 */

#include "stats.hpp"
#include "../log/status_reporter.hpp"

#include <format>

namespace phlop::monitoring {

// =============================================================================
// Форматирование
// =============================================================================

std::string format_games_rate(double rate) {
    const char* suffixes[] = {"games/s", "Kgames/s", "Mgames/s", "Ggames/s"};
    int suffix_idx = 0;

    while (rate >= 1000.0 && suffix_idx < 3) {
        rate /= 1000.0;
        ++suffix_idx;
    }

    return std::format("{:.2f} {}", rate, suffixes[suffix_idx]);
}

std::string format_duration(std::chrono::seconds seconds) {
    auto count = seconds.count();

    if (count < 60) {
        return std::format("{}s", count);
    }

    auto minutes = count / 60;
    auto secs = count % 60;

    if (minutes < 60) {
        return std::format("{}m {}s", minutes, secs);
    }

    auto hours = minutes / 60;
    minutes %= 60;

    if (hours < 24) {
        return std::format("{}h {}m", hours, minutes);
    }

    auto days = hours / 24;
    hours %= 24;

    return std::format("{}d {}h {}m", days, hours, minutes);
}

std::string format_chain_stats(const ChainStats& stats) {
    std::string out;
    out += "=== PhlopChain Statistics ===\n";
    out += std::format("Blocks:       {}\n", stats.total_blocks);
    out += std::format("Transactions: {}\n", stats.total_transactions);
    out += std::format("Games:        {} ({} rounds)\n", stats.total_games, stats.total_rounds);
    out += std::format("Rewards:      {} PHLOP\n", log::format_amount(stats.total_reward));
    out += std::format("Game rate:    {}\n", format_games_rate(stats.games_per_second));
    out += std::format("Chain age:    {}\n", format_duration(stats.chain_age));
    return out;
}

// =============================================================================
// Вычисление
// =============================================================================

ChainStats compute_chain_stats(std::span<const core::Block> chain) {
    ChainStats stats;
    stats.total_blocks = chain.size();

    for (const auto& block : chain) {
        stats.total_transactions += block.transactions.size();
        if (block.is_genesis()) {
            continue;
        }
        stats.total_games += block.mining.games_played;
        stats.total_rounds += block.mining.rounds;
        stats.total_reward += block.mining.reward;
    }

    if (chain.size() >= 2) {
        const auto& last = chain[chain.size() - 1];
        const auto& prev = chain[chain.size() - 2];
        int64_t elapsed = last.timestamp - prev.timestamp;
        if (elapsed > 0 && !last.is_genesis()) {
            stats.games_per_second =
                static_cast<double>(last.mining.games_played) / static_cast<double>(elapsed);
        }
    }

    if (!chain.empty()) {
        int64_t age = chain.back().timestamp - chain.front().timestamp;
        stats.chain_age = std::chrono::seconds(age > 0 ? age : 0);
    }

    return stats;
}

MinerStats compute_miner_stats(std::span<const core::Block> chain, std::string_view miner) {
    MinerStats stats;
    stats.miner = std::string(miner);

    for (const auto& block : chain) {
        if (block.is_genesis() || block.mining.miner != miner) {
            continue;
        }

        ++stats.blocks_mined;
        stats.total_reward += block.mining.reward;
        stats.games_played += block.mining.games_played;
        stats.history.push_back({
            block.index,
            block.mining.reward,
            block.mining.games_played,
            block.mining.rounds,
            block.timestamp
        });
    }

    return stats;
}

} // namespace phlop::monitoring
