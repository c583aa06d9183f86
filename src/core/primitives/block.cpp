/**
 * @file block.cpp
 * @brief Реализация блока
 */

#include "block.hpp"
#include "merkle.hpp"
#include "../constants.hpp"
#include "../serialization/stream.hpp"
#include "../../crypto/hash_commit.hpp"

#include <format>

namespace phlop::core {

namespace {

/// @brief Минимальный размер сериализованной транзакции (пустые строки)
constexpr std::size_t MIN_TX_SIZE = 1 + 1 + 8 + 8;

void write_header(serialization::WriteStream& out, const Block& block) {
    out.write_u32(block.index);
    out.write_i64(block.timestamp);
    out.write_hash256(block.previous_hash);
    out.write_hash256(block.merkle_root);

    const auto& m = block.mining;
    out.write_string(m.miner);
    out.write_u64(m.nonce);
    out.write_u32(m.difficulty);
    out.write_u32(m.rounds);
    out.write_u64(m.games_played);
    out.write_u64(m.min_games);
    out.write_u64(m.reward);
    out.write_hash256(m.outcome_digest);
}

void read_header(serialization::ReadStream& in, Block& block) {
    block.index = in.read_u32();
    block.timestamp = in.read_i64();
    block.previous_hash = in.read_hash256();
    block.merkle_root = in.read_hash256();

    auto& m = block.mining;
    m.miner = in.read_string();
    m.nonce = in.read_u64();
    m.difficulty = in.read_u32();
    m.rounds = in.read_u32();
    m.games_played = in.read_u64();
    m.min_games = in.read_u64();
    m.reward = in.read_u64();
    m.outcome_digest = in.read_hash256();
}

} // namespace

// =============================================================================
// Хеширование
// =============================================================================

Bytes Block::serialize_header() const {
    serialization::WriteStream out(160 + mining.miner.size());
    write_header(out, *this);
    return out.take_data();
}

Hash256 Block::compute_hash() const {
    Bytes header = serialize_header();
    return crypto::digest(ByteSpan{header});
}

std::vector<Hash256> Block::txids() const {
    std::vector<Hash256> ids;
    ids.reserve(transactions.size());
    for (const auto& tx : transactions) {
        ids.push_back(tx.txid());
    }
    return ids;
}

Hash256 Block::compute_merkle_root() const {
    std::vector<Hash256> ids = txids();
    return core::compute_merkle_root(ids);
}

void Block::seal() {
    merkle_root = compute_merkle_root();
    hash = compute_hash();
}

// =============================================================================
// Сериализация
// =============================================================================

Bytes Block::serialize() const {
    serialization::WriteStream out;
    write_header(out, *this);
    out.write_varint(transactions.size());
    for (const auto& tx : transactions) {
        tx.write_to(out);
    }
    out.write_hash256(hash);
    return out.take_data();
}

Result<Block> Block::deserialize(ByteSpan data) {
    try {
        serialization::ReadStream in(data);
        Block block;
        read_header(in, block);

        uint64_t count = in.read_varint();
        if (count > in.remaining() / MIN_TX_SIZE) {
            return Err<Block>(
                ErrorCode::DeserializationFailed,
                std::format("Блок {}: {} транзакций не помещаются в {} байт",
                            block.index, count, in.remaining())
            );
        }

        block.transactions.reserve(static_cast<std::size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            block.transactions.push_back(Transaction::read_from(in));
        }
        block.hash = in.read_hash256();

        if (!in.eof()) {
            return Err<Block>(
                ErrorCode::DeserializationFailed,
                std::format("Блок {}: {} лишних байт", block.index, in.remaining())
            );
        }
        return block;
    } catch (const serialization::StreamError& e) {
        return Err<Block>(ErrorCode::DeserializationFailed, e.what());
    }
}

const Hash256& genesis_previous_hash() {
    static const Hash256 sentinel = crypto::digest(constants::GENESIS_SENTINEL);
    return sentinel;
}

} // namespace phlop::core
