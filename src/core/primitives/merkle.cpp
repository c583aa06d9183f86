/**
 * @file merkle.cpp
 * @brief Реализация Merkle tree
 */

#include "merkle.hpp"
#include "../serialization/stream.hpp"
#include "../../crypto/hash_commit.hpp"

#include <format>

namespace phlop::core {

namespace {

/**
 * @brief Построить следующий уровень из текущего
 */
std::vector<Hash256> next_level(const std::vector<Hash256>& level) {
    std::vector<Hash256> parent;
    parent.reserve((level.size() + 1) / 2);

    for (std::size_t i = 0; i < level.size(); i += 2) {
        // Нечётный хвост объединяется сам с собой
        const Hash256& left = level[i];
        const Hash256& right = (i + 1 < level.size()) ? level[i + 1] : level[i];
        parent.push_back(crypto::digest_pair(left, right));
    }
    return parent;
}

} // namespace

// =============================================================================
// MerkleProof
// =============================================================================

Hash256 MerkleProof::compute_root(const Hash256& leaf) const noexcept {
    Hash256 current = leaf;
    for (const auto& step : steps) {
        if (step.side == SiblingSide::Left) {
            current = crypto::digest_pair(step.sibling, current);
        } else {
            current = crypto::digest_pair(current, step.sibling);
        }
    }
    return current;
}

Bytes MerkleProof::serialize() const {
    serialization::WriteStream out(1 + steps.size() * 33);
    out.write_varint(steps.size());
    for (const auto& step : steps) {
        out.write_u8(static_cast<uint8_t>(step.side));
        out.write_hash256(step.sibling);
    }
    return out.take_data();
}

Result<MerkleProof> MerkleProof::deserialize(ByteSpan data) {
    try {
        serialization::ReadStream in(data);
        MerkleProof proof;

        uint64_t count = in.read_varint();
        if (count > in.remaining() / 33) {
            return Err<MerkleProof>(
                ErrorCode::DeserializationFailed,
                std::format("Merkle proof: {} шагов не помещаются в {} байт", count, in.remaining())
            );
        }

        proof.steps.reserve(static_cast<std::size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            MerkleStep step;
            uint8_t side = in.read_u8();
            if (side > 1) {
                return Err<MerkleProof>(
                    ErrorCode::DeserializationFailed,
                    std::format("Merkle proof: неизвестная сторона {}", side)
                );
            }
            step.side = static_cast<SiblingSide>(side);
            step.sibling = in.read_hash256();
            proof.steps.push_back(step);
        }

        if (!in.eof()) {
            return Err<MerkleProof>(ErrorCode::DeserializationFailed, "Merkle proof: лишние байты");
        }
        return proof;
    } catch (const serialization::StreamError& e) {
        return Err<MerkleProof>(ErrorCode::DeserializationFailed, e.what());
    }
}

// =============================================================================
// MerkleTree
// =============================================================================

MerkleTree::MerkleTree(std::vector<Hash256> leaves) {
    if (leaves.empty()) {
        root_ = crypto::empty_digest();
        levels_.emplace_back();
        return;
    }

    levels_.push_back(std::move(leaves));
    while (levels_.back().size() > 1) {
        levels_.push_back(next_level(levels_.back()));
    }
    root_ = levels_.back().front();
}

const Hash256& MerkleTree::root() const noexcept {
    return root_;
}

Result<MerkleProof> MerkleTree::prove(std::size_t index) const {
    if (index >= leaf_count()) {
        return Err<MerkleProof>(
            ErrorCode::IndexOutOfRange,
            std::format("Индекс листа {} при {} листьях", index, leaf_count())
        );
    }

    MerkleProof proof;
    std::size_t idx = index;

    // Последний уровень - корень, sibling для него не нужен
    for (std::size_t level = 0; level + 1 < levels_.size(); ++level) {
        const auto& nodes = levels_[level];
        if (idx & 1) {
            proof.steps.push_back({nodes[idx - 1], SiblingSide::Left});
        } else {
            // Без правого соседа узел дублируется
            std::size_t sibling = (idx + 1 < nodes.size()) ? idx + 1 : idx;
            proof.steps.push_back({nodes[sibling], SiblingSide::Right});
        }
        idx /= 2;
    }

    return proof;
}

std::size_t MerkleTree::leaf_count() const noexcept {
    return levels_.front().size();
}

std::size_t MerkleTree::depth() const noexcept {
    return levels_.size() - 1;
}

// =============================================================================
// Свободные функции
// =============================================================================

Hash256 compute_merkle_root(std::span<const Hash256> leaves) {
    if (leaves.empty()) {
        return crypto::empty_digest();
    }

    std::vector<Hash256> level(leaves.begin(), leaves.end());
    while (level.size() > 1) {
        level = next_level(level);
    }
    return level.front();
}

Result<MerkleProof> prove_inclusion(std::span<const Hash256> leaves, std::size_t index) {
    if (index >= leaves.size()) {
        return Err<MerkleProof>(
            ErrorCode::IndexOutOfRange,
            std::format("Индекс листа {} при {} листьях", index, leaves.size())
        );
    }
    MerkleTree tree(std::vector<Hash256>(leaves.begin(), leaves.end()));
    return tree.prove(index);
}

bool verify_inclusion(
    const Hash256& leaf,
    const MerkleProof& proof,
    const Hash256& expected_root
) noexcept {
    return proof.compute_root(leaf) == expected_root;
}

} // namespace phlop::core
