/**
 * @file rps_engine.cpp
 * @brief Реализация движка RPS-майнинга
 */

#include "rps_engine.hpp"
#include "game.hpp"
#include "../core/serialization/stream.hpp"
#include "../crypto/hash_commit.hpp"

#include <algorithm>
#include <format>

namespace phlop::mining {

// =============================================================================
// Таблица и награда
// =============================================================================

Hash256 outcome_digest(const PlayerTable& players) {
    core::serialization::WriteStream out(players.size() * 12);
    for (const auto& p : players) {
        out.write_u32(p.target);
        out.write_u32(p.wins);
        out.write_u32(p.games);
    }
    return crypto::digest(ByteSpan{out.data()});
}

Amount reward_units(uint64_t min_games, uint64_t games_played) noexcept {
    if (games_played == 0) {
        return 0;
    }
    // floor(floor(x / a) / a) == floor(x / a^2), a^2 не вычисляется
    uint64_t scaled = min_games * constants::UNITS_PER_PHLOP;
    return (scaled / games_played) / games_played;
}

double reward_phlop(uint64_t min_games, uint64_t games_played) noexcept {
    if (games_played == 0) {
        return 0.0;
    }
    double a = static_cast<double>(games_played);
    return static_cast<double>(min_games) / (a * a);
}

core::MiningMetadata MiningResult::to_metadata() const {
    core::MiningMetadata meta;
    meta.miner = inputs.miner;
    meta.nonce = inputs.nonce;
    meta.difficulty = inputs.block_index;
    meta.rounds = rounds;
    meta.games_played = games_played;
    meta.min_games = min_games;
    meta.reward = reward;
    meta.outcome_digest = outcome_digest();
    return meta;
}

// =============================================================================
// MiningAttempt
// =============================================================================

MiningAttempt::MiningAttempt(SeedInputs inputs, uint32_t max_rounds)
    : inputs_(std::move(inputs))
    , max_rounds_(max_rounds)
    , quota_(quota_for_block(inputs_.block_index))
    , stream_(derive_seed(inputs_.previous_hash, inputs_.miner, inputs_.nonce))
{
    for (std::size_t i = 0; i < players_.size(); ++i) {
        players_[i].target = quota_.target_for(i);
    }
}

bool MiningAttempt::all_finished() const noexcept {
    return std::all_of(players_.begin(), players_.end(),
                       [](const PlayerTally& p) { return p.finished(); });
}

AttemptState MiningAttempt::step() {
    if (state_ == AttemptState::Succeeded || state_ == AttemptState::Failed) {
        return state_;
    }
    state_ = AttemptState::InProgress;

    if (rounds_ >= max_rounds_) {
        state_ = AttemptState::Failed;
        return state_;
    }

    for (auto& player : players_) {
        if (player.finished()) {
            continue;
        }
        Move miner = stream_.next_move();
        Move opponent = stream_.next_move();
        ++player.games;
        ++games_;
        if (play(miner, opponent) == GameOutcome::Win) {
            ++player.wins;
        }
    }
    ++rounds_;

    if (all_finished()) {
        state_ = AttemptState::Succeeded;
    } else if (rounds_ >= max_rounds_) {
        state_ = AttemptState::Failed;
    }
    return state_;
}

AttemptState MiningAttempt::run() {
    while (step() == AttemptState::InProgress) {
    }
    return state_;
}

MiningResult MiningAttempt::result() const {
    MiningResult r;
    r.success = state_ == AttemptState::Succeeded;
    r.inputs = inputs_;
    r.rounds = rounds_;
    r.games_played = games_;
    r.min_games = quota_.min_games();
    r.players = players_;
    r.reward = r.success ? reward_units(r.min_games, r.games_played) : 0;
    return r;
}

// =============================================================================
// MiningEngine
// =============================================================================

MiningResult MiningEngine::simulate(const SeedInputs& inputs) const {
    MiningAttempt attempt(inputs, max_rounds_);
    attempt.run();
    return attempt.result();
}

Result<MiningResult> MiningEngine::mine(const SeedInputs& inputs) const {
    MiningResult result = simulate(inputs);
    if (!result.success) {
        return Err<MiningResult>(
            ErrorCode::MiningFailed,
            std::format("Майнер '{}' nonce {}: не завершено за {} раундов ({} игр)",
                        inputs.miner, inputs.nonce, result.rounds, result.games_played)
        );
    }
    return result;
}

Result<void> MiningEngine::verify(const core::Block& block) const {
    const auto& meta = block.mining;

    auto mismatch = [&](std::string_view field, uint64_t stored, uint64_t replayed) {
        return Err<void>(
            ErrorCode::MiningProofMismatch,
            std::format("Блок {}: {} записано {}, воспроизведено {}",
                        block.index, field, stored, replayed)
        );
    };

    if (meta.difficulty != block.index) {
        return mismatch("difficulty", meta.difficulty, block.index);
    }
    if (meta.rounds > max_rounds_) {
        return Err<void>(
            ErrorCode::MiningProofMismatch,
            std::format("Блок {}: {} раундов превышает лимит {}",
                        block.index, meta.rounds, max_rounds_)
        );
    }

    SeedInputs inputs;
    inputs.previous_hash = block.previous_hash;
    inputs.miner = meta.miner;
    inputs.nonce = meta.nonce;
    inputs.block_index = block.index;

    MiningResult replay = simulate(inputs);
    if (!replay.success) {
        return Err<void>(
            ErrorCode::MiningProofMismatch,
            std::format("Блок {}: повторная симуляция не завершилась успехом", block.index)
        );
    }

    if (meta.rounds != replay.rounds) {
        return mismatch("rounds", meta.rounds, replay.rounds);
    }
    if (meta.games_played != replay.games_played) {
        return mismatch("games_played", meta.games_played, replay.games_played);
    }
    if (meta.min_games != replay.min_games) {
        return mismatch("min_games", meta.min_games, replay.min_games);
    }
    if (meta.reward != replay.reward) {
        return mismatch("reward", meta.reward, replay.reward);
    }
    if (meta.outcome_digest != replay.outcome_digest()) {
        return Err<void>(
            ErrorCode::MiningProofMismatch,
            std::format("Блок {}: outcome_digest не совпадает", block.index)
        );
    }
    return {};
}

} // namespace phlop::mining
