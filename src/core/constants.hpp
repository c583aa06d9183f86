/**
 * @file constants.hpp
 * @brief Константы протокола PhlopChain
 *
 * Содержит размеры структур, параметры RPS-консенсуса и значения
 * по умолчанию для конфигурации.
 *
 * @note Все константы определены как constexpr для compile-time вычислений.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace phlop::constants {

// =============================================================================
// Размеры структур
// =============================================================================

/// @brief Размер SHA256 хеша в байтах
inline constexpr std::size_t SHA256_SIZE = 32;

/// @brief Размер блока SHA256 (один transform) в байтах
inline constexpr std::size_t SHA256_BLOCK_SIZE = 64;

// =============================================================================
// RPS консенсус
// =============================================================================

/// @brief Количество виртуальных игроков в каждой попытке майнинга
inline constexpr std::size_t VIRTUAL_PLAYERS = 100;

/// @brief Требуемое число побед для нижнего уровня
inline constexpr uint32_t LOW_TIER_WINS = 1;

/// @brief Требуемое число побед для верхнего уровня (плато после блока 100)
inline constexpr uint32_t HIGH_TIER_WINS = 2;

/// @brief Лимит раундов одной попытки по умолчанию
inline constexpr uint32_t DEFAULT_MAX_ROUNDS = 10'000;

/// @brief Количество nonce, перебираемых mine_pending по умолчанию
inline constexpr uint32_t DEFAULT_MAX_ATTEMPTS = 16;

// =============================================================================
// Монета и цепь
// =============================================================================

/// @brief Минимальных единиц в одном PhlopCoin
inline constexpr uint64_t UNITS_PER_PHLOP = 1'000'000'000'000ULL;

/// @brief Отправитель mint-транзакции (награда и genesis-распределение)
inline constexpr std::string_view COINBASE_SENDER = "coinbase";

/// @brief Данные, хеш которых служит previous hash для genesis блока
inline constexpr std::string_view GENESIS_SENTINEL = "genesis";

/// @brief Временная метка genesis по умолчанию
inline constexpr int64_t DEFAULT_GENESIS_TIMESTAMP = 1'700'000'000;

/// @brief Максимум pending транзакций в блоке (без mint)
inline constexpr std::size_t DEFAULT_MAX_TXS_PER_BLOCK = 100;

/// @brief Верхняя граница настройки max_transactions_per_block
inline constexpr std::size_t MAX_TXS_PER_BLOCK_LIMIT = 10'000;

/// @brief Размер истории событий по умолчанию
inline constexpr std::size_t DEFAULT_EVENT_HISTORY = 200;

// =============================================================================
// Начальные значения SHA256 (H0-H7)
// =============================================================================

/// @brief Начальные значения хеша SHA256 (FIPS 180-4)
inline constexpr std::array<uint32_t, 8> SHA256_INIT = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

/// @brief Константы раунда SHA256 (первые 32 бита дробной части кубических корней простых чисел)
inline constexpr std::array<uint32_t, 64> SHA256_K = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

} // namespace phlop::constants
