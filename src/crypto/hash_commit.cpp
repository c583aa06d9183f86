/**
 * @file hash_commit.cpp
 * @brief Реализация HashCommit поверх SHA256
 */

#include "hash_commit.hpp"
#include "sha256.hpp"

namespace phlop::crypto {

Hash256 digest(ByteSpan data) noexcept {
    return sha256(data);
}

Hash256 digest(std::string_view data) noexcept {
    return sha256(as_bytes(data));
}

Hash256 digest_pair(const Hash256& left, const Hash256& right) noexcept {
    Sha256 hasher;
    hasher.update(ByteSpan{left.data(), left.size()});
    hasher.update(ByteSpan{right.data(), right.size()});
    return hasher.finalize();
}

const Hash256& empty_digest() noexcept {
    static const Hash256 empty = sha256(ByteSpan{});
    return empty;
}

} // namespace phlop::crypto
