/**
 * @file sha256.hpp
 * @brief SHA256 (FIPS 180-4)
 *
 * Программная реализация SHA256, используемая HashCommit слоем:
 * - однократный хеш произвольных данных
 * - инкрементальный хешер для составных структур
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <cstdint>
#include <string_view>

namespace phlop::crypto {

/**
 * @brief SHA256 состояние (8 x 32-bit слов)
 */
using Sha256State = std::array<uint32_t, 8>;

/**
 * @brief Вычислить SHA256 transform для одного 64-байтного блока
 *
 * @param state Текущее состояние хеша (будет модифицировано)
 * @param block Указатель на 64 байта данных
 *
 * @warning block должен содержать ровно 64 байта!
 */
void sha256_transform(Sha256State& state, const uint8_t* block) noexcept;

/**
 * @brief Вычислить SHA256 хеш данных произвольной длины
 *
 * @param data Входные данные для хеширования
 * @return Hash256 32-байтный хеш
 */
[[nodiscard]] Hash256 sha256(ByteSpan data) noexcept;

/**
 * @brief Инкрементальный SHA256
 *
 * Позволяет хешировать данные частями без промежуточного буфера:
 * @code
 * Sha256 hasher;
 * hasher.update(seed);
 * hasher.update(counter_bytes);
 * Hash256 block = hasher.finalize();
 * @endcode
 */
class Sha256 {
public:
    Sha256() noexcept;

    /**
     * @brief Добавить данные
     */
    Sha256& update(ByteSpan data) noexcept;

    /**
     * @brief Добавить строку как байты
     */
    Sha256& update(std::string_view data) noexcept;

    /**
     * @brief Завершить вычисление и получить хеш
     *
     * После вызова хешер сбрасывается в начальное состояние.
     */
    [[nodiscard]] Hash256 finalize() noexcept;

    /**
     * @brief Сбросить в начальное состояние
     */
    void reset() noexcept;

private:
    Sha256State state_;
    std::array<uint8_t, constants::SHA256_BLOCK_SIZE> buffer_{};
    std::size_t buffered_{0};
    uint64_t total_len_{0};
};

} // namespace phlop::crypto
