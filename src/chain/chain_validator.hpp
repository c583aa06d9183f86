/**
 * @file chain_validator.hpp
 * @brief Цепь блоков и её проверка
 *
 * ChainValidator владеет последовательностью блоков и кэшированным
 * Ledger. Новый блок добавляется только если результат майнинга
 * относится к текущей вершине, воспроизводится повторной симуляцией,
 * а pending транзакции проходят пробное применение к ledger.
 *
 * Валидация цепи только читает данные и сообщает обо всех нарушениях,
 * ничего не исправляя.
 *
 * Класс не потокобезопасен: синхронизацию обеспечивает node::Node.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../core/primitives/block.hpp"
#include "../core/primitives/merkle.hpp"
#include "../core/primitives/transaction.hpp"
#include "../ledger/ledger.hpp"
#include "../mining/rps_engine.hpp"

#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace phlop::chain {

/// @brief Цепь: блоки с индексами 0..N
using Chain = std::vector<core::Block>;

// =============================================================================
// Параметры
// =============================================================================

/**
 * @brief Начальное начисление genesis блока
 */
struct GenesisAllocation {
    std::string account;
    Amount amount{0};  ///< В минимальных единицах
};

/**
 * @brief Параметры цепи
 */
struct ChainParams {
    uint32_t max_rounds = constants::DEFAULT_MAX_ROUNDS;
    std::size_t max_transactions_per_block = constants::DEFAULT_MAX_TXS_PER_BLOCK;
    bool verify_mining_on_validate = true;
    int64_t genesis_timestamp = constants::DEFAULT_GENESIS_TIMESTAMP;
    std::vector<GenesisAllocation> genesis_allocations;

    /**
     * @brief Параметры из конфигурации (балансы genesis в единицах)
     */
    [[nodiscard]] static ChainParams from_config(const Config& config);
};

/**
 * @brief Построить genesis блок
 *
 * Одна mint транзакция на каждый счёт (nonce = позиция счёта),
 * пустые метаданные майнинга, previous_hash = H("genesis").
 */
[[nodiscard]] core::Block make_genesis_block(const ChainParams& params);

// =============================================================================
// Отчёт валидации
// =============================================================================

/**
 * @brief Одно найденное нарушение
 */
struct ValidationIssue {
    uint32_t block_index{0};
    ErrorCode code{ErrorCode::Success};
    std::string message;
};

/**
 * @brief Результат проверки всей цепи
 */
struct ValidationReport {
    std::size_t blocks_checked{0};
    std::vector<ValidationIssue> issues;

    [[nodiscard]] bool valid() const noexcept { return issues.empty(); }

    /**
     * @brief Есть ли нарушение данного вида (в любом блоке)
     */
    [[nodiscard]] bool has(ErrorCode code) const noexcept;

    /**
     * @brief Есть ли нарушение данного вида в блоке
     */
    [[nodiscard]] bool has(uint32_t block_index, ErrorCode code) const noexcept;

    /**
     * @brief Текстовое описание: одна строка на нарушение
     */
    [[nodiscard]] std::string summary() const;
};

// =============================================================================
// Поиск
// =============================================================================

/**
 * @brief Положение транзакции в цепи
 */
struct TxLocation {
    uint32_t block_index{0};
    std::size_t tx_index{0};
    core::Transaction tx;
};

/**
 * @brief Доказательство включения транзакции в блок
 */
struct InclusionProof {
    uint32_t block_index{0};
    std::size_t tx_index{0};
    Hash256 txid{};
    core::MerkleProof proof;
    Hash256 merkle_root{};

    /**
     * @brief Проверить доказательство без обращения к цепи
     */
    [[nodiscard]] bool verify() const noexcept;
};

/**
 * @brief Запись истории счёта
 */
struct AccountEntry {
    uint32_t block_index{0};
    int64_t timestamp{0};
    core::Transaction tx;
};

// =============================================================================
// ChainValidator
// =============================================================================

/**
 * @brief Источник времени для новых блоков (Unix секунды)
 */
using TimeSource = std::function<int64_t()>;

class ChainValidator {
public:
    /**
     * @brief Создать цепь с genesis блоком
     *
     * @throws std::invalid_argument если genesis начисления некорректны
     *         (пустое имя, coinbase, нулевая сумма, переполнение)
     */
    explicit ChainValidator(ChainParams params);

    /**
     * @brief Добавить блок по результату майнинга
     *
     * Блок: index = длина цепи, previous_hash = хеш вершины,
     * транзакции = pending + mint(miner, reward) последней.
     *
     * @return Result<core::Block> Добавленный блок или ошибка:
     *         - InvalidMiningResult: неуспешная попытка, чужой майнер,
     *           результат не воспроизводится
     *         - HashMismatch: результат получен для другой вершины
     *         - InvalidTransaction: слишком много транзакций, mint среди
     *           pending, транзакция не проходит пробное применение
     */
    [[nodiscard]] Result<core::Block> append(
        std::string_view miner,
        std::span<const core::Transaction> pending,
        const mining::MiningResult& result
    );

    /**
     * @brief Проверить результат майнинга воспроизведением симуляции
     *
     * Не зависит от состояния цепи: вершина не сверяется, поэтому вызов
     * возможен без блокировки цепи.
     *
     * @return Result<void> InvalidMiningResult при неуспешной попытке,
     *         чужом майнере, расхождении с воспроизведением или нулевой награде
     */
    [[nodiscard]] static Result<void> verify_mining_result(
        const mining::MiningEngine& engine,
        std::string_view miner,
        const mining::MiningResult& result
    );

    /**
     * @brief Добавить блок по уже проверенному результату
     *
     * То же, что append, но без воспроизведения симуляции. Результат
     * должен пройти verify_mining_result с движком engine().
     */
    [[nodiscard]] Result<core::Block> append_verified(
        std::string_view miner,
        std::span<const core::Transaction> pending,
        const mining::MiningResult& result
    );

    /**
     * @brief Пробное применение pending транзакций к текущему ledger
     */
    [[nodiscard]] Result<void> check_pending(std::span<const core::Transaction> pending) const;

    /**
     * @brief Проверить собственную цепь (включая сверку кэша ledger)
     */
    [[nodiscard]] ValidationReport validate() const;

    /**
     * @brief Проверить произвольную цепь
     *
     * @param chain Цепь для проверки
     * @param params Параметры (лимит раундов, проверка майнинга)
     * @param cached Кэшированный ledger для сверки (опционально)
     */
    [[nodiscard]] static ValidationReport validate(
        std::span<const core::Block> chain,
        const ChainParams& params,
        const ledger::Ledger* cached = nullptr
    );

    /**
     * @brief Входные данные seed для следующего блока
     */
    [[nodiscard]] mining::SeedInputs next_seed_inputs(std::string miner, uint64_t nonce) const;

    // ==========================================================================
    // Доступ
    // ==========================================================================

    [[nodiscard]] const Chain& blocks() const noexcept { return blocks_; }
    [[nodiscard]] const core::Block& tip() const noexcept { return blocks_.back(); }
    [[nodiscard]] std::size_t size() const noexcept { return blocks_.size(); }
    [[nodiscard]] const ledger::Ledger& ledger() const noexcept { return ledger_; }
    [[nodiscard]] const ChainParams& params() const noexcept { return params_; }
    [[nodiscard]] const mining::MiningEngine& engine() const noexcept { return engine_; }

    [[nodiscard]] Result<core::Block> block_at(uint32_t index) const;
    [[nodiscard]] Result<core::Block> block_by_hash(const Hash256& hash) const;
    [[nodiscard]] Result<TxLocation> find_transaction(const Hash256& txid) const;
    [[nodiscard]] Result<InclusionProof> prove_transaction(const Hash256& txid) const;

    /**
     * @brief Все транзакции, где счёт отправитель или получатель
     */
    [[nodiscard]] std::vector<AccountEntry> account_history(std::string_view account) const;

    /**
     * @brief Заменить источник времени (по умолчанию system_clock)
     */
    void set_time_source(TimeSource source);

private:
    void index_block(const core::Block& block);

    [[nodiscard]] static Result<void> check_result_claim(
        std::string_view miner, const mining::MiningResult& result);

    /// @brief HashMismatch если результат получен не для текущей вершины
    [[nodiscard]] Result<void> check_result_tip(const mining::MiningResult& result) const;

    /// @brief Проверка pending, сборка блока и применение к ledger
    [[nodiscard]] Result<core::Block> commit(
        std::string_view miner,
        std::span<const core::Transaction> pending,
        const mining::MiningResult& result
    );

    ChainParams params_;
    mining::MiningEngine engine_;
    Chain blocks_;
    ledger::Ledger ledger_;

    /// @brief txid -> (block_index, tx_index)
    std::map<Hash256, std::pair<uint32_t, std::size_t>> tx_index_;
    std::map<Hash256, uint32_t> block_index_;

    TimeSource time_source_;
};

} // namespace phlop::chain
