/**
 * @file game.hpp
 * @brief Камень-ножницы-бумага: ходы и исход одной игры
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace phlop::mining {

/**
 * @brief Ход игрока
 *
 * Числовые значения совпадают с остатком b mod 3 из потока seed.
 */
enum class Move : uint8_t {
    Rock = 0,
    Paper = 1,
    Scissors = 2
};

/**
 * @brief Исход игры с точки зрения майнера
 */
enum class GameOutcome : uint8_t {
    Win,
    Loss,
    Tie
};

/**
 * @brief Бьёт ли ход a ход b
 *
 * Камень бьёт ножницы, бумага бьёт камень, ножницы бьют бумагу.
 */
[[nodiscard]] constexpr bool beats(Move a, Move b) noexcept {
    return (static_cast<unsigned>(a) + 2) % 3 == static_cast<unsigned>(b);
}

/**
 * @brief Сыграть одну игру
 */
[[nodiscard]] constexpr GameOutcome play(Move miner, Move opponent) noexcept {
    if (miner == opponent) {
        return GameOutcome::Tie;
    }
    return beats(miner, opponent) ? GameOutcome::Win : GameOutcome::Loss;
}

[[nodiscard]] constexpr std::string_view to_string(Move move) noexcept {
    switch (move) {
        case Move::Rock:     return "rock";
        case Move::Paper:    return "paper";
        case Move::Scissors: return "scissors";
        default: return "unknown";
    }
}

} // namespace phlop::mining
