/**
 * @file seed_stream.hpp
 * @brief Детерминированный поток ходов из seed попытки майнинга
 *
 * seed    = H(previous_hash || miner || nonce:u64)
 * block_k = H(seed || k:u64), k = 0, 1, 2, ...
 *
 * Байты блоков потребляются по порядку. Ход = b mod 3, байт 255
 * отбрасывается (иначе распределение смещено к камню).
 */

#pragma once

#include "game.hpp"
#include "../core/types.hpp"

#include <cstdint>
#include <string_view>

namespace phlop::mining {

/**
 * @brief Вычислить seed попытки
 *
 * @param previous_hash Хеш текущей вершины цепи
 * @param miner Имя майнера (кодируется строкой с VarInt длиной)
 * @param nonce Nonce попытки (8 байт little-endian)
 */
[[nodiscard]] Hash256 derive_seed(
    const Hash256& previous_hash,
    std::string_view miner,
    uint64_t nonce
);

/**
 * @brief Поток псевдослучайных ходов в режиме счётчика
 */
class SeedStream {
public:
    explicit SeedStream(const Hash256& seed) noexcept;

    /**
     * @brief Следующий байт потока
     */
    [[nodiscard]] uint8_t next_byte() noexcept;

    /**
     * @brief Следующий ход (с отбрасыванием байта 255)
     */
    [[nodiscard]] Move next_move() noexcept;

    /**
     * @brief Сколько 32-байтных блоков уже сгенерировано
     */
    [[nodiscard]] uint64_t blocks_generated() const noexcept { return counter_; }

private:
    void refill() noexcept;

    Hash256 seed_;
    Hash256 block_{};
    std::size_t pos_;
    uint64_t counter_{0};
};

} // namespace phlop::mining
