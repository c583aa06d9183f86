/**
 * @file node.hpp
 * @brief Узел PhlopChain: потокобезопасный фасад над цепью
 *
 * Единственное изменяемое общее состояние (Chain + Ledger) находится в
 * ChainValidator под std::shared_mutex:
 * - append_block воспроизводит результат майнинга без блокировок, затем
 *   берёт эксклюзивную только для сверки вершины и фиксации блока
 * - чтения (get_chain, get_balance, validate_chain, ...) берут разделяемую
 * - mine снимает вершину под разделяемой блокировкой, а симуляцию
 *   выполняет без блокировок, поэтому попытки разных майнеров идут
 *   параллельно
 *
 * Результат, полученный для устаревшей вершины, отклоняется с
 * HashMismatch. Повторами управляет вызывающий (mine_pending повторяет
 * со следующим nonce).
 *
 * Порядок захвата: chain_mutex_, затем pool_mutex_.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../core/primitives/block.hpp"
#include "../core/primitives/transaction.hpp"
#include "../chain/chain_validator.hpp"
#include "../log/status_reporter.hpp"
#include "../mining/difficulty.hpp"
#include "../mining/rps_engine.hpp"
#include "../monitoring/stats.hpp"

#include <mutex>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace phlop::node {

class Node {
public:
    /**
     * @brief Создать узел из конфигурации
     *
     * @throws std::invalid_argument при некорректных genesis счетах
     */
    explicit Node(const Config& config);

    // Запрещаем копирование
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // ==========================================================================
    // Майнинг и добавление блоков
    // ==========================================================================

    /**
     * @brief Провести попытку майнинга следующего блока
     *
     * pending проверяются пробным применением до симуляции.
     *
     * @return Result<mining::MiningResult> Результат, MiningFailed
     *         или InvalidTransaction
     */
    [[nodiscard]] Result<mining::MiningResult> mine(
        const std::string& miner,
        std::span<const core::Transaction> pending,
        uint64_t nonce
    );

    /**
     * @brief Добавить блок по результату майнинга
     *
     * @return Result<core::Block> Блок, InvalidTransaction, HashMismatch
     *         или InvalidMiningResult
     */
    [[nodiscard]] Result<core::Block> append_block(
        const std::string& miner,
        std::span<const core::Transaction> pending,
        const mining::MiningResult& result
    );

    // ==========================================================================
    // Чтение
    // ==========================================================================

    /**
     * @brief Снимок цепи
     */
    [[nodiscard]] chain::Chain get_chain() const;

    [[nodiscard]] Result<core::Block> get_block(uint32_t index) const;

    [[nodiscard]] std::size_t height() const;

    [[nodiscard]] Amount get_balance(std::string_view account) const;

    [[nodiscard]] uint64_t get_nonce(std::string_view account) const;

    /**
     * @brief Снимок всех балансов
     */
    [[nodiscard]] ledger::AccountMap<Amount> get_accounts() const;

    /**
     * @brief Проверить цепь целиком
     */
    [[nodiscard]] chain::ValidationReport validate_chain();

    /**
     * @brief Сложность следующего блока
     */
    [[nodiscard]] mining::DifficultyInfo difficulty_info() const;

    [[nodiscard]] Hash256 state_root() const;

    [[nodiscard]] std::vector<chain::AccountEntry> account_history(std::string_view account) const;

    // ==========================================================================
    // Pending пул
    // ==========================================================================

    /**
     * @brief Принять транзакцию в pending пул
     *
     * Проверяется против ledger, спроецированного через уже
     * ожидающие транзакции.
     *
     * @return Result<Hash256> txid или ошибка ledger
     */
    [[nodiscard]] Result<Hash256> submit_transaction(const core::Transaction& tx);

    [[nodiscard]] std::vector<core::Transaction> pending_transactions() const;

    /**
     * @brief Добыть блок из pending транзакций
     *
     * Берёт до max_transactions_per_block транзакций, перебирает nonce
     * 0..max_attempts-1. Включённые транзакции удаляются из пула.
     *
     * @return Result<core::Block> Блок или MiningFailed, если все попытки
     *         не удались
     */
    [[nodiscard]] Result<core::Block> mine_pending(const std::string& miner);

    // ==========================================================================
    // Доказательства и статистика
    // ==========================================================================

    [[nodiscard]] Result<chain::InclusionProof> transaction_proof(const Hash256& txid) const;

    /**
     * @brief Проверить доказательство включения без доступа к узлу
     */
    [[nodiscard]] static bool verify_transaction_proof(const chain::InclusionProof& proof) noexcept;

    [[nodiscard]] monitoring::ChainStats stats() const;

    [[nodiscard]] monitoring::MinerStats miner_stats(std::string_view miner) const;

    [[nodiscard]] log::StatusReporter& reporter() noexcept { return reporter_; }

    /**
     * @brief Заменить источник времени новых блоков
     */
    void set_time_source(chain::TimeSource source);

private:
    /**
     * @brief Убрать из пула транзакции, которые больше не применяются
     *
     * Требует удерживаемых chain_mutex_ (любой) и pool_mutex_.
     *
     * @return ledger::LedgerOverlay Проекция ledger после оставшихся транзакций,
     *         действительна пока удерживается chain_mutex_
     */
    ledger::LedgerOverlay prune_pool_locked();

    /**
     * @brief Обновить сводку в репортёре. Требует удерживаемой chain_mutex_.
     */
    void refresh_status_locked();

    mutable std::shared_mutex chain_mutex_;
    chain::ChainValidator validator_;

    /// @brief Копия движка цепи для симуляции и проверки вне блокировок
    mining::MiningEngine engine_;

    uint32_t max_attempts_;

    mutable std::mutex pool_mutex_;
    std::vector<core::Transaction> pool_;

    log::StatusReporter reporter_;
};

} // namespace phlop::node
