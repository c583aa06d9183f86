/**
 * @file merkle.hpp
 * @brief Merkle tree над txid транзакций блока
 *
 * Правила построения (общие для build, prove и verify):
 * - внутренний узел = H(left || right)
 * - при нечётном числе узлов на уровне последний узел дублируется
 * - один лист является корнем сам по себе
 * - пустое дерево имеет корень H("") (crypto::empty_digest)
 */

#pragma once

#include "../types.hpp"

#include <span>
#include <vector>

namespace phlop::core {

/**
 * @brief С какой стороны от текущего узла стоит sibling
 */
enum class SiblingSide : uint8_t {
    Left = 0,   ///< sibling слева: H(sibling || current)
    Right = 1   ///< sibling справа: H(current || sibling)
};

/**
 * @brief Один шаг доказательства включения
 */
struct MerkleStep {
    Hash256 sibling{};
    SiblingSide side{SiblingSide::Right};

    [[nodiscard]] bool operator==(const MerkleStep&) const = default;
};

/**
 * @brief Доказательство включения листа (путь от листа к корню)
 */
struct MerkleProof {
    /// @brief Шаги от уровня листьев к корню
    std::vector<MerkleStep> steps;

    /**
     * @brief Вычислить корень, поднимаясь от листа по шагам
     *
     * @param leaf Хеш листа
     * @return Hash256 Корень, к которому ведёт доказательство
     */
    [[nodiscard]] Hash256 compute_root(const Hash256& leaf) const noexcept;

    /**
     * @brief Сериализовать proof: VarInt(count) || (side:u8 || sibling:32)*
     */
    [[nodiscard]] Bytes serialize() const;

    /**
     * @brief Десериализовать proof
     *
     * @return Result<MerkleProof> Proof или DeserializationFailed
     */
    [[nodiscard]] static Result<MerkleProof> deserialize(ByteSpan data);

    [[nodiscard]] bool operator==(const MerkleProof&) const = default;
};

/**
 * @brief Merkle tree с сохранёнными уровнями
 *
 * Хранит все уровни, чтобы выдавать доказательства без перестроения.
 */
class MerkleTree {
public:
    /**
     * @brief Построить дерево из листьев
     *
     * @param leaves Хеши транзакций в порядке следования в блоке
     */
    explicit MerkleTree(std::vector<Hash256> leaves);

    /**
     * @brief Корень дерева
     */
    [[nodiscard]] const Hash256& root() const noexcept;

    /**
     * @brief Доказательство включения листа
     *
     * @param index Индекс листа
     * @return Result<MerkleProof> Proof или IndexOutOfRange
     */
    [[nodiscard]] Result<MerkleProof> prove(std::size_t index) const;

    [[nodiscard]] std::size_t leaf_count() const noexcept;

    /**
     * @brief Количество уровней над листьями
     */
    [[nodiscard]] std::size_t depth() const noexcept;

private:
    /// @brief levels_[0] = листья, levels_.back() = {root}
    std::vector<std::vector<Hash256>> levels_;
    Hash256 root_{};
};

// =============================================================================
// Функции без сохранения дерева
// =============================================================================

/**
 * @brief Вычислить Merkle root
 *
 * Чистая функция: одинаковая последовательность всегда даёт одинаковый корень.
 */
[[nodiscard]] Hash256 compute_merkle_root(std::span<const Hash256> leaves);

/**
 * @brief Построить доказательство включения для leaves[index]
 */
[[nodiscard]] Result<MerkleProof> prove_inclusion(
    std::span<const Hash256> leaves,
    std::size_t index
);

/**
 * @brief Проверить доказательство включения
 *
 * Не зависит от исходной последовательности, только от листа,
 * шагов и ожидаемого корня.
 */
[[nodiscard]] bool verify_inclusion(
    const Hash256& leaf,
    const MerkleProof& proof,
    const Hash256& expected_root
) noexcept;

} // namespace phlop::core
