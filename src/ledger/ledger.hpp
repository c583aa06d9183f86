/**
 * @file ledger.hpp
 * @brief Балансы счетов и nonce отправителей
 *
 * Ledger - производная от истории транзакций цепи. Его всегда можно
 * воспроизвести через rebuild_from(), кэшированное состояние источником
 * истины не является.
 *
 * Правила применения транзакции:
 * - mint (sender = COINBASE_SENDER): только зачисление получателю
 * - перевод: sender != receiver, amount > 0, nonce == nonce_of(sender) + 1,
 *   balance_of(sender) >= amount
 * - все зачисления с проверкой переполнения
 *
 * Неудачное применение не меняет состояние.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/block.hpp"
#include "../core/primitives/transaction.hpp"

#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace phlop::ledger {

/// @brief Счёт -> значение, с поиском по string_view
template<typename T>
using AccountMap = std::map<std::string, T, std::less<>>;

class LedgerOverlay;

/**
 * @brief Состояние счетов
 */
class Ledger {
public:
    Ledger() = default;

    /**
     * @brief Проверить транзакцию без применения
     *
     * @return Result<void> InvalidTransaction, InvalidNonce,
     *         InsufficientFunds или BalanceOverflow
     */
    [[nodiscard]] Result<void> check(const core::Transaction& tx) const;

    /**
     * @brief Применить транзакцию
     *
     * При ошибке состояние не меняется.
     */
    [[nodiscard]] Result<void> apply(const core::Transaction& tx);

    /**
     * @brief Применить все транзакции блока
     *
     * Атомарно: либо применяются все, либо ни одна. Изменения копятся в
     * LedgerOverlay, копия всего ledger не делается.
     */
    [[nodiscard]] Result<void> apply_block(const core::Block& block);

    /**
     * @brief Сбросить состояние и воспроизвести все транзакции цепи
     *
     * При ошибке ledger остаётся в прежнем состоянии, сообщение ошибки
     * содержит индекс блока и транзакции.
     */
    [[nodiscard]] Result<void> rebuild_from(std::span<const core::Block> chain);

    /**
     * @brief Баланс счёта (0 для неизвестного)
     */
    [[nodiscard]] Amount balance_of(std::string_view account) const;

    /**
     * @brief Nonce последней применённой транзакции отправителя (0 если не было)
     */
    [[nodiscard]] uint64_t nonce_of(std::string_view account) const;

    [[nodiscard]] const AccountMap<Amount>& accounts() const noexcept { return balances_; }

    /// @brief Сумма всех mint
    [[nodiscard]] Amount total_supply() const noexcept { return total_supply_; }

    /**
     * @brief Merkle root по листьям H("account:balance") в порядке счетов
     */
    [[nodiscard]] Hash256 state_root() const;

    void reset() noexcept;

    [[nodiscard]] bool operator==(const Ledger&) const = default;

private:
    friend class LedgerOverlay;

    AccountMap<Amount> balances_;
    AccountMap<uint64_t> nonces_;
    Amount total_supply_{0};
};

/**
 * @brief Изменения поверх Ledger без копирования базового состояния
 *
 * Хранит только затронутые счета. Чтение идёт сначала из overlay, затем
 * из базы. Базовый Ledger должен жить дольше overlay и не меняться, пока
 * overlay используется.
 */
class LedgerOverlay {
public:
    explicit LedgerOverlay(const Ledger& base) noexcept;

    /// @brief Те же проверки, что Ledger::check, с учётом изменений overlay
    [[nodiscard]] Result<void> check(const core::Transaction& tx) const;

    /// @brief Применить транзакцию к overlay; при ошибке overlay не меняется
    [[nodiscard]] Result<void> apply(const core::Transaction& tx);

    [[nodiscard]] Amount balance_of(std::string_view account) const;
    [[nodiscard]] uint64_t nonce_of(std::string_view account) const;
    [[nodiscard]] Amount total_supply() const noexcept { return total_supply_; }

    /// @brief Число затронутых счетов
    [[nodiscard]] std::size_t touched() const noexcept { return balances_.size(); }

    /**
     * @brief Перенести изменения в ledger
     *
     * @param target Ledger, над которым построен overlay
     */
    void commit_to(Ledger& target) &&;

private:
    const Ledger* base_;
    AccountMap<Amount> balances_;
    AccountMap<uint64_t> nonces_;
    Amount total_supply_;
};

} // namespace phlop::ledger
