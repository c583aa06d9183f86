/**
 * @file block.hpp
 * @brief Блок PhlopChain
 *
 * Блок хранит заголовок (index, timestamp, previous_hash, merkle_root),
 * метаданные RPS-майнинга, список транзакций и собственный хеш.
 * Хеш блока = H(serialize_header()), поэтому любое изменение заголовка,
 * метаданных или (через merkle_root) транзакций меняет хеш.
 */

#pragma once

#include "../types.hpp"
#include "transaction.hpp"

#include <string>
#include <vector>

namespace phlop::core {

/**
 * @brief Метаданные майнинга, достаточные для воспроизведения попытки
 *
 * Seed восстанавливается из (previous_hash, miner, nonce), остальные
 * поля сверяются с результатом повторной симуляции.
 * У genesis блока все поля нулевые.
 */
struct MiningMetadata {
    /// @brief Имя майнера (получатель награды)
    std::string miner;

    /// @brief Nonce попытки
    uint64_t nonce{0};

    /// @brief Уровень сложности (= индекс блока)
    uint32_t difficulty{0};

    /// @brief Сыгранных раундов
    uint32_t rounds{0};

    /// @brief Всего сыгранных игр (a)
    uint64_t games_played{0};

    /// @brief Минимально необходимое число игр (n)
    uint64_t min_games{0};

    /// @brief Награда в минимальных единицах
    Amount reward{0};

    /// @brief Дайджест таблицы игроков (target, wins, games)
    Hash256 outcome_digest{};

    [[nodiscard]] bool operator==(const MiningMetadata&) const = default;
};

/**
 * @brief Блок
 */
struct Block {
    /// @brief Высота блока (0 = genesis)
    uint32_t index{0};

    /// @brief Unix timestamp
    int64_t timestamp{0};

    /// @brief Хеш предыдущего блока (H("genesis") для genesis)
    Hash256 previous_hash{};

    /// @brief Merkle root по txid транзакций
    Hash256 merkle_root{};

    MiningMetadata mining;

    /// @brief Транзакции; в майненом блоке mint всегда последняя
    std::vector<Transaction> transactions;

    /// @brief Сохранённый хеш блока
    Hash256 hash{};

    // =========================================================================
    // Хеширование
    // =========================================================================

    /**
     * @brief Сериализовать заголовок вместе с метаданными майнинга
     *
     * index:u32, timestamp:i64, previous_hash, merkle_root, miner:string,
     * nonce:u64, difficulty:u32, rounds:u32, games_played:u64,
     * min_games:u64, reward:u64, outcome_digest
     */
    [[nodiscard]] Bytes serialize_header() const;

    /**
     * @brief Пересчитать хеш блока по текущим полям
     */
    [[nodiscard]] Hash256 compute_hash() const;

    /**
     * @brief txid всех транзакций в порядке блока
     */
    [[nodiscard]] std::vector<Hash256> txids() const;

    /**
     * @brief Пересчитать Merkle root по текущим транзакциям
     */
    [[nodiscard]] Hash256 compute_merkle_root() const;

    /**
     * @brief Заполнить merkle_root и hash по текущему содержимому
     */
    void seal();

    // =========================================================================
    // Сериализация
    // =========================================================================

    /**
     * @brief Полная сериализация: заголовок, VarInt(tx_count), транзакции, hash
     */
    [[nodiscard]] Bytes serialize() const;

    /**
     * @brief Десериализовать блок
     *
     * Хеш не пересчитывается: проверка целостности выполняется валидатором.
     *
     * @return Result<Block> Блок или DeserializationFailed
     */
    [[nodiscard]] static Result<Block> deserialize(ByteSpan data);

    [[nodiscard]] bool is_genesis() const noexcept { return index == 0; }

    [[nodiscard]] bool operator==(const Block&) const = default;
};

/**
 * @brief previous_hash для genesis блока: H("genesis")
 */
[[nodiscard]] const Hash256& genesis_previous_hash();

} // namespace phlop::core
