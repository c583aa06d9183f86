/**
 * @file transaction.hpp
 * @brief Транзакция PhlopChain
 *
 * Перевод суммы между именованными счетами. Подписей нет: отправитель
 * определяется значением поля sender.
 */

#pragma once

#include "../types.hpp"

#include <string>

namespace phlop::core {

namespace serialization {
class ReadStream;
class WriteStream;
} // namespace serialization

/**
 * @brief Транзакция
 *
 * Каноническая сериализация:
 * - sender:   VarInt длина + байты
 * - receiver: VarInt длина + байты
 * - amount:   8 байт (uint64_t, little-endian)
 * - nonce:    8 байт (uint64_t, little-endian)
 */
struct Transaction {
    /// @brief Отправитель (COINBASE_SENDER для mint)
    std::string sender;

    /// @brief Получатель
    std::string receiver;

    /// @brief Сумма в минимальных единицах
    Amount amount{0};

    /// @brief Порядковый номер транзакции отправителя (начиная с 1)
    ///
    /// Для mint: номер блока (или позиция genesis-счёта), только для
    /// уникальности txid.
    uint64_t nonce{0};

    /**
     * @brief Является ли транзакция mint (эмиссией)
     */
    [[nodiscard]] bool is_mint() const noexcept;

    /**
     * @brief Создать mint транзакцию от COINBASE_SENDER
     */
    [[nodiscard]] static Transaction make_mint(
        std::string receiver,
        Amount amount,
        uint64_t nonce
    );

    // =========================================================================
    // Сериализация
    // =========================================================================

    void write_to(serialization::WriteStream& out) const;

    /**
     * @brief Прочитать транзакцию из потока
     *
     * @throws serialization::StreamError при нехватке данных
     */
    [[nodiscard]] static Transaction read_from(serialization::ReadStream& in);

    [[nodiscard]] Bytes serialize() const;

    /**
     * @brief Идентификатор транзакции: H(serialize())
     */
    [[nodiscard]] Hash256 txid() const;

    // =========================================================================
    // Проверки
    // =========================================================================

    /**
     * @brief Структурная проверка, не зависящая от состояния ledger
     *
     * - sender и receiver не пустые и различны
     * - amount > 0
     * - receiver не равен COINBASE_SENDER
     *
     * @return Result<void> InvalidTransaction с причиной при нарушении
     */
    [[nodiscard]] Result<void> validate_structure() const;

    [[nodiscard]] bool operator==(const Transaction&) const = default;
};

} // namespace phlop::core
