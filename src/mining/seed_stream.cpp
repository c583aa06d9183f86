/**
 * @file seed_stream.cpp
 * @brief Реализация потока ходов
 */

#include "seed_stream.hpp"
#include "../core/byte_order.hpp"
#include "../core/serialization/stream.hpp"
#include "../crypto/sha256.hpp"

#include <array>

namespace phlop::mining {

Hash256 derive_seed(const Hash256& previous_hash, std::string_view miner, uint64_t nonce) {
    core::serialization::WriteStream out(32 + 9 + miner.size() + 8);
    out.write_hash256(previous_hash);
    out.write_string(miner);
    out.write_u64(nonce);
    return crypto::sha256(ByteSpan{out.data()});
}

SeedStream::SeedStream(const Hash256& seed) noexcept
    : seed_(seed)
    , pos_(block_.size()) {}

void SeedStream::refill() noexcept {
    std::array<uint8_t, 8> counter_le;
    write_le64(counter_le.data(), counter_);

    crypto::Sha256 hasher;
    hasher.update(ByteSpan{seed_.data(), seed_.size()});
    hasher.update(ByteSpan{counter_le.data(), counter_le.size()});
    block_ = hasher.finalize();

    ++counter_;
    pos_ = 0;
}

uint8_t SeedStream::next_byte() noexcept {
    if (pos_ >= block_.size()) {
        refill();
    }
    return block_[pos_++];
}

Move SeedStream::next_move() noexcept {
    for (;;) {
        uint8_t b = next_byte();
        if (b != 255) {
            return static_cast<Move>(b % 3);
        }
    }
}

} // namespace phlop::mining
