/**
 * @file hash_commit.hpp
 * @brief HashCommit: фиксированный 256-битный дайджест для всех структур цепи
 *
 * Единственная точка, через которую блоки, транзакции, Merkle дерево
 * и майнинг получают хеши. Дайджест = одинарный SHA256.
 */

#pragma once

#include "../core/types.hpp"

#include <string_view>

namespace phlop::crypto {

/**
 * @brief Дайджест произвольной последовательности байт
 */
[[nodiscard]] Hash256 digest(ByteSpan data) noexcept;

/**
 * @brief Дайджест строки (байты UTF-8 как есть)
 */
[[nodiscard]] Hash256 digest(std::string_view data) noexcept;

/**
 * @brief Дайджест конкатенации двух хешей: H(left || right)
 *
 * Используется для внутренних узлов Merkle дерева.
 */
[[nodiscard]] Hash256 digest_pair(const Hash256& left, const Hash256& right) noexcept;

/**
 * @brief Дайджест пустой последовательности (Merkle root пустого дерева)
 */
[[nodiscard]] const Hash256& empty_digest() noexcept;

} // namespace phlop::crypto
