/**
 * @file rps_engine.hpp
 * @brief Движок RPS-майнинга
 *
 * Майнер играет в камень-ножницы-бумагу против 100 виртуальных игроков,
 * пока каждый игрок не наберёт свою цель побед. Все ходы берутся из
 * SeedStream, поэтому попытка полностью воспроизводима по
 * (previous_hash, miner, nonce) и индексу блока.
 *
 * Награда: reward = n / a^2, где n - минимум игр, a - сыграно игр.
 * В минимальных единицах: floor(floor(n * 10^12 / a) / a).
 *
 * Жизненный цикл попытки:
 * @code
 * Idle -> InProgress -> Succeeded
 *                    -> Failed (превышен лимит раундов)
 * @endcode
 *
 * MiningEngine не имеет изменяемого состояния и может использоваться
 * из нескольких потоков одновременно.
 */

#pragma once

#include "difficulty.hpp"
#include "seed_stream.hpp"
#include "../core/types.hpp"
#include "../core/constants.hpp"
#include "../core/primitives/block.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace phlop::mining {

// =============================================================================
// Таблица игроков
// =============================================================================

/**
 * @brief Счётчики одного виртуального игрока
 */
struct PlayerTally {
    uint32_t target{0};
    uint32_t wins{0};
    uint32_t games{0};

    [[nodiscard]] bool finished() const noexcept { return wins >= target; }

    [[nodiscard]] bool operator==(const PlayerTally&) const = default;
};

using PlayerTable = std::array<PlayerTally, constants::VIRTUAL_PLAYERS>;

/**
 * @brief H(target:u32 || wins:u32 || games:u32 для каждого игрока)
 */
[[nodiscard]] Hash256 outcome_digest(const PlayerTable& players);

// =============================================================================
// Награда
// =============================================================================

/**
 * @brief Награда в минимальных единицах: floor(n * 10^12 / a^2)
 *
 * @return 0 если a == 0
 */
[[nodiscard]] Amount reward_units(uint64_t min_games, uint64_t games_played) noexcept;

/**
 * @brief Награда в PhlopCoin (вещественная): n / a^2
 */
[[nodiscard]] double reward_phlop(uint64_t min_games, uint64_t games_played) noexcept;

// =============================================================================
// Попытка майнинга
// =============================================================================

/**
 * @brief Состояние попытки
 */
enum class AttemptState : uint8_t {
    Idle,
    InProgress,
    Succeeded,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(AttemptState state) noexcept {
    switch (state) {
        case AttemptState::Idle:       return "idle";
        case AttemptState::InProgress: return "in_progress";
        case AttemptState::Succeeded:  return "succeeded";
        case AttemptState::Failed:     return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Входные данные, из которых выводится seed
 */
struct SeedInputs {
    /// @brief Хеш вершины цепи, на которую майнится блок
    Hash256 previous_hash{};

    std::string miner;
    uint64_t nonce{0};

    /// @brief Индекс майнящегося блока (определяет квоту)
    uint32_t block_index{0};

    [[nodiscard]] bool operator==(const SeedInputs&) const = default;
};

/**
 * @brief Результат попытки майнинга
 *
 * Потребляется один раз при сборке блока.
 */
struct MiningResult {
    bool success{false};
    SeedInputs inputs;

    uint32_t rounds{0};

    /// @brief a
    uint64_t games_played{0};

    /// @brief n
    uint64_t min_games{0};

    PlayerTable players{};

    /// @brief Награда в минимальных единицах (0 при неудаче)
    Amount reward{0};

    [[nodiscard]] double reward_phlop() const noexcept {
        return success ? mining::reward_phlop(min_games, games_played) : 0.0;
    }

    [[nodiscard]] Hash256 outcome_digest() const { return mining::outcome_digest(players); }

    /**
     * @brief Метаданные для записи в блок
     */
    [[nodiscard]] core::MiningMetadata to_metadata() const;
};

/**
 * @brief Одна попытка майнинга (конечный автомат)
 */
class MiningAttempt {
public:
    /**
     * @param inputs Входные данные seed
     * @param max_rounds Лимит раундов, после которого попытка неуспешна
     */
    MiningAttempt(SeedInputs inputs, uint32_t max_rounds);

    [[nodiscard]] AttemptState state() const noexcept { return state_; }

    /**
     * @brief Сыграть один раунд
     *
     * Раунд: для каждого игрока 0..99, не достигшего цели, ход майнера,
     * затем ход игрока. В конечном состоянии ничего не делает.
     *
     * @return AttemptState Состояние после раунда
     */
    AttemptState step();

    /**
     * @brief Играть раунды до конечного состояния
     */
    AttemptState run();

    [[nodiscard]] const Quota& quota() const noexcept { return quota_; }
    [[nodiscard]] const PlayerTable& players() const noexcept { return players_; }
    [[nodiscard]] uint32_t rounds() const noexcept { return rounds_; }
    [[nodiscard]] uint64_t games_played() const noexcept { return games_; }

    /**
     * @brief Снимок результата (success = state() == Succeeded)
     */
    [[nodiscard]] MiningResult result() const;

private:
    [[nodiscard]] bool all_finished() const noexcept;

    SeedInputs inputs_;
    uint32_t max_rounds_;
    Quota quota_;
    SeedStream stream_;
    PlayerTable players_{};
    AttemptState state_{AttemptState::Idle};
    uint32_t rounds_{0};
    uint64_t games_{0};
};

// =============================================================================
// MiningEngine
// =============================================================================

/**
 * @brief Движок майнинга и проверки доказательств
 */
class MiningEngine {
public:
    explicit MiningEngine(uint32_t max_rounds = constants::DEFAULT_MAX_ROUNDS) noexcept
        : max_rounds_(max_rounds) {}

    /**
     * @brief Провести попытку до конца и вернуть результат любого исхода
     */
    [[nodiscard]] MiningResult simulate(const SeedInputs& inputs) const;

    /**
     * @brief Провести попытку майнинга
     *
     * @return Result<MiningResult> Успешный результат или MiningFailed
     */
    [[nodiscard]] Result<MiningResult> mine(const SeedInputs& inputs) const;

    /**
     * @brief Проверить метаданные майнинга блока повторной симуляцией
     *
     * Сверяются difficulty, rounds, games_played, min_games, reward и
     * outcome_digest.
     *
     * @return Result<void> MiningProofMismatch с описанием расхождения
     */
    [[nodiscard]] Result<void> verify(const core::Block& block) const;

    [[nodiscard]] uint32_t max_rounds() const noexcept { return max_rounds_; }

private:
    uint32_t max_rounds_;
};

} // namespace phlop::mining
