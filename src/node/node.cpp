/**
 * @file node.cpp
 * @brief Реализация узла PhlopChain
 */

#include "node.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <format>
#include <set>

namespace phlop::node {

namespace {

constexpr std::string_view COMPONENT = "Node";

} // namespace

Node::Node(const Config& config)
    : validator_(chain::ChainParams::from_config(config))
    , engine_(validator_.engine())
    , max_attempts_(config.mining.max_attempts)
    , reporter_(config.logging)
{
    refresh_status_locked();
}

// =============================================================================
// Майнинг и добавление блоков
// =============================================================================

Result<mining::MiningResult> Node::mine(
    const std::string& miner,
    std::span<const core::Transaction> pending,
    uint64_t nonce
) {
    mining::SeedInputs inputs;
    {
        std::shared_lock lock(chain_mutex_);
        if (auto r = validator_.check_pending(pending); !r) {
            return std::unexpected(r.error());
        }
        inputs = validator_.next_seed_inputs(miner, nonce);
    }

    // Симуляция без блокировок
    auto result = engine_.mine(inputs);
    if (!result) {
        log::debug(COMPONENT, result.error().message);
        reporter_.log_mining_failed(miner, nonce, result.error().message);
    }
    return result;
}

Result<core::Block> Node::append_block(
    const std::string& miner,
    std::span<const core::Transaction> pending,
    const mining::MiningResult& result
) {
    // Воспроизведение результата до захвата блокировки записи
    if (auto r = chain::ChainValidator::verify_mining_result(engine_, miner, result); !r) {
        reporter_.log_error(r.error().message);
        return std::unexpected(r.error());
    }

    std::unique_lock lock(chain_mutex_);

    auto block = validator_.append_verified(miner, pending, result);
    if (!block) {
        if (block.error().code == ErrorCode::HashMismatch) {
            log::debug(COMPONENT, std::format("Устаревший результат '{}': {}",
                                              miner, block.error().message));
        } else {
            reporter_.log_error(block.error().message);
        }
        return block;
    }

    auto mined = monitoring::compute_miner_stats(validator_.blocks(), miner).blocks_mined;
    reporter_.update_block_count(miner, mined);
    reporter_.log_block_mined(block->index, miner, block->mining.games_played,
                              block->mining.reward);
    refresh_status_locked();
    return block;
}

// =============================================================================
// Чтение
// =============================================================================

chain::Chain Node::get_chain() const {
    std::shared_lock lock(chain_mutex_);
    return validator_.blocks();
}

Result<core::Block> Node::get_block(uint32_t index) const {
    std::shared_lock lock(chain_mutex_);
    return validator_.block_at(index);
}

std::size_t Node::height() const {
    std::shared_lock lock(chain_mutex_);
    return validator_.size();
}

Amount Node::get_balance(std::string_view account) const {
    std::shared_lock lock(chain_mutex_);
    return validator_.ledger().balance_of(account);
}

uint64_t Node::get_nonce(std::string_view account) const {
    std::shared_lock lock(chain_mutex_);
    return validator_.ledger().nonce_of(account);
}

ledger::AccountMap<Amount> Node::get_accounts() const {
    std::shared_lock lock(chain_mutex_);
    return validator_.ledger().accounts();
}

chain::ValidationReport Node::validate_chain() {
    std::shared_lock lock(chain_mutex_);
    auto report = validator_.validate();
    reporter_.log_validation(report.valid(), report.blocks_checked, report.issues.size());
    return report;
}

mining::DifficultyInfo Node::difficulty_info() const {
    std::shared_lock lock(chain_mutex_);
    return mining::difficulty_info(static_cast<uint32_t>(validator_.size()));
}

Hash256 Node::state_root() const {
    std::shared_lock lock(chain_mutex_);
    return validator_.ledger().state_root();
}

std::vector<chain::AccountEntry> Node::account_history(std::string_view account) const {
    std::shared_lock lock(chain_mutex_);
    return validator_.account_history(account);
}

// =============================================================================
// Pending пул
// =============================================================================

ledger::LedgerOverlay Node::prune_pool_locked() {
    ledger::LedgerOverlay projected(validator_.ledger());

    std::vector<core::Transaction> kept;
    kept.reserve(pool_.size());
    for (auto& tx : pool_) {
        if (projected.apply(tx)) {
            kept.push_back(std::move(tx));
        } else {
            log::debug(COMPONENT, std::format("Транзакция {} -> {} удалена из пула",
                                              tx.sender, tx.receiver));
        }
    }
    pool_ = std::move(kept);
    return projected;
}

Result<Hash256> Node::submit_transaction(const core::Transaction& tx) {
    if (tx.is_mint()) {
        reporter_.log_tx_rejected("Mint транзакция не принимается в пул");
        return Err<Hash256>(ErrorCode::InvalidTransaction,
                            "Mint транзакция не принимается в пул");
    }

    std::shared_lock chain_lock(chain_mutex_);
    std::lock_guard<std::mutex> pool_lock(pool_mutex_);

    ledger::LedgerOverlay projected = prune_pool_locked();
    if (auto r = projected.check(tx); !r) {
        log::info(COMPONENT, std::format("Транзакция отклонена: {}", r.error().message));
        reporter_.log_tx_rejected(r.error().message);
        return std::unexpected(r.error());
    }

    pool_.push_back(tx);
    reporter_.log_tx_accepted(tx.sender, tx.receiver, tx.amount);
    return tx.txid();
}

std::vector<core::Transaction> Node::pending_transactions() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return pool_;
}

Result<core::Block> Node::mine_pending(const std::string& miner) {
    for (uint32_t attempt = 0; attempt < max_attempts_; ++attempt) {
        std::vector<core::Transaction> batch;
        {
            std::shared_lock chain_lock(chain_mutex_);
            std::lock_guard<std::mutex> pool_lock(pool_mutex_);
            prune_pool_locked();

            std::size_t take = std::min(pool_.size(),
                                        validator_.params().max_transactions_per_block);
            batch.assign(pool_.begin(), pool_.begin() + static_cast<std::ptrdiff_t>(take));
        }

        auto result = mine(miner, batch, attempt);
        if (!result) {
            // Пул мог измениться между снимком и проверкой
            if (result.error().code == ErrorCode::MiningFailed ||
                result.error().code == ErrorCode::InvalidTransaction) {
                continue;
            }
            return std::unexpected(result.error());
        }

        auto block = append_block(miner, batch, *result);
        if (block) {
            std::set<Hash256> included;
            for (const auto& tx : batch) {
                included.insert(tx.txid());
            }

            std::lock_guard<std::mutex> pool_lock(pool_mutex_);
            std::erase_if(pool_, [&included](const core::Transaction& tx) {
                return included.contains(tx.txid());
            });
            return block;
        }

        // Вершина сменилась или пул устарел: следующий nonce на новой вершине
        if (block.error().code == ErrorCode::HashMismatch ||
            block.error().code == ErrorCode::InvalidTransaction) {
            continue;
        }
        return block;
    }

    return Err<core::Block>(
        ErrorCode::MiningFailed,
        std::format("Майнер '{}': {} попыток без успеха", miner, max_attempts_)
    );
}

// =============================================================================
// Доказательства и статистика
// =============================================================================

Result<chain::InclusionProof> Node::transaction_proof(const Hash256& txid) const {
    std::shared_lock lock(chain_mutex_);
    return validator_.prove_transaction(txid);
}

bool Node::verify_transaction_proof(const chain::InclusionProof& proof) noexcept {
    return proof.verify();
}

monitoring::ChainStats Node::stats() const {
    std::shared_lock lock(chain_mutex_);
    return monitoring::compute_chain_stats(validator_.blocks());
}

monitoring::MinerStats Node::miner_stats(std::string_view miner) const {
    std::shared_lock lock(chain_mutex_);
    return monitoring::compute_miner_stats(validator_.blocks(), miner);
}

void Node::set_time_source(chain::TimeSource source) {
    std::unique_lock lock(chain_mutex_);
    validator_.set_time_source(std::move(source));
}

void Node::refresh_status_locked() {
    const auto& blocks = validator_.blocks();
    auto stats = monitoring::compute_chain_stats(blocks);
    auto next = static_cast<uint32_t>(blocks.size());
    auto quota = mining::quota_for_block(next);

    log::ChainStatus status;
    status.height = static_cast<uint32_t>(blocks.size());
    status.total_games = stats.total_games;
    status.total_supply = validator_.ledger().total_supply();
    status.next_block = next;
    status.next_low_players = quota.low_players;
    status.next_high_players = quota.high_players;
    status.next_min_games = quota.min_games();
    reporter_.update_chain_status(status);
}

} // namespace phlop::node
