/**
 * @file byte_order.hpp
 * @brief Функции для работы с порядком байт и hex-представлением
 *
 * Каноническая сериализация PhlopChain использует little-endian для
 * целых чисел, SHA256 внутри использует big-endian слова.
 *
 * @note Все функции помечены noexcept, кроме возвращающих std::string.
 */

#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace phlop {

// =============================================================================
// Little-endian
// =============================================================================

inline void write_le32(uint8_t* dest, uint32_t value) noexcept {
    dest[0] = static_cast<uint8_t>(value);
    dest[1] = static_cast<uint8_t>(value >> 8);
    dest[2] = static_cast<uint8_t>(value >> 16);
    dest[3] = static_cast<uint8_t>(value >> 24);
}

inline void write_le64(uint8_t* dest, uint64_t value) noexcept {
    write_le32(dest, static_cast<uint32_t>(value));
    write_le32(dest + 4, static_cast<uint32_t>(value >> 32));
}

[[nodiscard]] inline uint32_t read_le32(const uint8_t* src) noexcept {
    return static_cast<uint32_t>(src[0]) |
           (static_cast<uint32_t>(src[1]) << 8) |
           (static_cast<uint32_t>(src[2]) << 16) |
           (static_cast<uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline uint64_t read_le64(const uint8_t* src) noexcept {
    return static_cast<uint64_t>(read_le32(src)) |
           (static_cast<uint64_t>(read_le32(src + 4)) << 32);
}

// =============================================================================
// Big-endian (слова SHA256)
// =============================================================================

inline void write_be32(uint8_t* dest, uint32_t value) noexcept {
    dest[0] = static_cast<uint8_t>(value >> 24);
    dest[1] = static_cast<uint8_t>(value >> 16);
    dest[2] = static_cast<uint8_t>(value >> 8);
    dest[3] = static_cast<uint8_t>(value);
}

[[nodiscard]] inline uint32_t read_be32(const uint8_t* src) noexcept {
    return (static_cast<uint32_t>(src[0]) << 24) |
           (static_cast<uint32_t>(src[1]) << 16) |
           (static_cast<uint32_t>(src[2]) << 8) |
           static_cast<uint32_t>(src[3]);
}

// =============================================================================
// Hex
// =============================================================================

/**
 * @brief Байты в lowercase hex
 */
[[nodiscard]] inline std::string to_hex(ByteSpan data) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0x0F]);
    }
    return out;
}

/**
 * @brief Hash256 в hex (в порядке хранения байт)
 */
[[nodiscard]] inline std::string to_hex(const Hash256& hash) {
    return to_hex(ByteSpan{hash.data(), hash.size()});
}

/**
 * @brief Разобрать 64-символьную hex строку в Hash256
 *
 * @return std::nullopt при неверной длине или символе
 */
[[nodiscard]] inline std::optional<Hash256> hash_from_hex(std::string_view hex) noexcept {
    if (hex.size() != 64) {
        return std::nullopt;
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    Hash256 result{};
    for (std::size_t i = 0; i < result.size(); ++i) {
        int hi = nibble(hex[i * 2]);
        int lo = nibble(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        result[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

} // namespace phlop
