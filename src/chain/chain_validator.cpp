/**
 * @file chain_validator.cpp
 * @brief Реализация цепи и её проверки
 */

#include "chain_validator.hpp"
#include "../core/byte_order.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <stdexcept>

namespace phlop::chain {

namespace {

constexpr std::string_view COMPONENT = "ChainValidator";

int64_t system_time() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * @brief Первые 8 байт хеша в hex для сообщений
 */
std::string short_hex(const Hash256& hash) {
    return to_hex(ByteSpan{hash.data(), 8});
}

/**
 * @brief Проверка размещения mint транзакций в блоке
 *
 * genesis: только mint транзакции, метаданные майнинга пустые.
 * Остальные: ровно одна mint, последней, майнеру, на сумму награды.
 */
Result<void> check_mint_placement(const core::Block& block) {
    if (block.is_genesis()) {
        for (const auto& tx : block.transactions) {
            if (!tx.is_mint()) {
                return Err<void>(ErrorCode::MiningProofMismatch,
                                 "Genesis блок содержит не-mint транзакцию");
            }
        }
        if (block.mining != core::MiningMetadata{}) {
            return Err<void>(ErrorCode::MiningProofMismatch,
                             "Genesis блок содержит метаданные майнинга");
        }
        return {};
    }

    if (block.transactions.empty() || !block.transactions.back().is_mint()) {
        return Err<void>(
            ErrorCode::MiningProofMismatch,
            std::format("Блок {}: последняя транзакция не mint", block.index)
        );
    }

    auto mints = std::count_if(block.transactions.begin(), block.transactions.end(),
                               [](const core::Transaction& tx) { return tx.is_mint(); });
    if (mints != 1) {
        return Err<void>(
            ErrorCode::MiningProofMismatch,
            std::format("Блок {}: {} mint транзакций вместо одной", block.index, mints)
        );
    }

    const auto& mint = block.transactions.back();
    if (mint.receiver != block.mining.miner) {
        return Err<void>(
            ErrorCode::MiningProofMismatch,
            std::format("Блок {}: награда '{}' вместо майнера '{}'",
                        block.index, mint.receiver, block.mining.miner)
        );
    }
    if (mint.amount != block.mining.reward) {
        return Err<void>(
            ErrorCode::MiningProofMismatch,
            std::format("Блок {}: mint {} при награде {}",
                        block.index, mint.amount, block.mining.reward)
        );
    }
    if (mint.nonce != block.index) {
        return Err<void>(
            ErrorCode::MiningProofMismatch,
            std::format("Блок {}: nonce mint {}", block.index, mint.nonce)
        );
    }
    return {};
}

} // namespace

// =============================================================================
// Параметры и genesis
// =============================================================================

ChainParams ChainParams::from_config(const Config& config) {
    ChainParams params;
    params.max_rounds = config.mining.max_rounds;
    params.max_transactions_per_block = config.chain.max_transactions_per_block;
    params.verify_mining_on_validate = config.chain.verify_mining_on_validate;
    params.genesis_timestamp = config.genesis.timestamp;

    for (const auto& account : config.genesis.accounts) {
        params.genesis_allocations.push_back({account.name, account.balance_units()});
    }
    return params;
}

core::Block make_genesis_block(const ChainParams& params) {
    core::Block genesis;
    genesis.index = 0;
    genesis.timestamp = params.genesis_timestamp;
    genesis.previous_hash = core::genesis_previous_hash();

    uint64_t position = 0;
    for (const auto& alloc : params.genesis_allocations) {
        genesis.transactions.push_back(
            core::Transaction::make_mint(alloc.account, alloc.amount, position++));
    }

    genesis.seal();
    return genesis;
}

// =============================================================================
// ValidationReport
// =============================================================================

bool ValidationReport::has(ErrorCode code) const noexcept {
    return std::any_of(issues.begin(), issues.end(),
                       [code](const ValidationIssue& i) { return i.code == code; });
}

bool ValidationReport::has(uint32_t block_index, ErrorCode code) const noexcept {
    return std::any_of(issues.begin(), issues.end(), [&](const ValidationIssue& i) {
        return i.block_index == block_index && i.code == code;
    });
}

std::string ValidationReport::summary() const {
    if (issues.empty()) {
        return std::format("Цепь корректна: проверено блоков {}\n", blocks_checked);
    }

    std::string out = std::format("Найдено нарушений: {} (блоков {})\n",
                                  issues.size(), blocks_checked);
    for (const auto& issue : issues) {
        out += std::format("  #{} [{}] {}\n", issue.block_index,
                           to_string(issue.code), issue.message);
    }
    return out;
}

bool InclusionProof::verify() const noexcept {
    return core::verify_inclusion(txid, proof, merkle_root);
}

// =============================================================================
// ChainValidator
// =============================================================================

ChainValidator::ChainValidator(ChainParams params)
    : params_(std::move(params))
    , engine_(params_.max_rounds)
    , time_source_(system_time)
{
    core::Block genesis = make_genesis_block(params_);

    if (auto r = ledger_.apply_block(genesis); !r) {
        throw std::invalid_argument(
            std::format("Некорректный genesis: {}", r.error().message));
    }

    index_block(genesis);
    blocks_.push_back(std::move(genesis));

    log::debug(COMPONENT, std::format("Genesis {} создан, счетов: {}",
                                      short_hex(blocks_.front().hash),
                                      params_.genesis_allocations.size()));
}

void ChainValidator::set_time_source(TimeSource source) {
    time_source_ = std::move(source);
}

void ChainValidator::index_block(const core::Block& block) {
    block_index_[block.hash] = block.index;
    for (std::size_t i = 0; i < block.transactions.size(); ++i) {
        tx_index_[block.transactions[i].txid()] = {block.index, i};
    }
}

mining::SeedInputs ChainValidator::next_seed_inputs(std::string miner, uint64_t nonce) const {
    mining::SeedInputs inputs;
    inputs.previous_hash = tip().hash;
    inputs.miner = std::move(miner);
    inputs.nonce = nonce;
    inputs.block_index = static_cast<uint32_t>(blocks_.size());
    return inputs;
}

Result<void> ChainValidator::check_pending(std::span<const core::Transaction> pending) const {
    if (pending.size() > params_.max_transactions_per_block) {
        return Err<void>(
            ErrorCode::InvalidTransaction,
            std::format("{} транзакций при лимите {}",
                        pending.size(), params_.max_transactions_per_block)
        );
    }

    ledger::LedgerOverlay scratch(ledger_);
    for (std::size_t i = 0; i < pending.size(); ++i) {
        const auto& tx = pending[i];
        if (tx.is_mint()) {
            return Err<void>(
                ErrorCode::InvalidTransaction,
                std::format("Транзакция {}: mint среди pending", i)
            );
        }
        if (auto r = scratch.apply(tx); !r) {
            return Err<void>(
                ErrorCode::InvalidTransaction,
                std::format("Транзакция {}: {} ({})", i, r.error().message,
                            to_string(r.error().code))
            );
        }
    }
    return {};
}

Result<void> ChainValidator::check_result_claim(
    std::string_view miner,
    const mining::MiningResult& result
) {
    if (!result.success) {
        return Err<void>(ErrorCode::InvalidMiningResult,
                         "Результат неуспешной попытки майнинга");
    }
    if (result.inputs.miner != miner) {
        return Err<void>(
            ErrorCode::InvalidMiningResult,
            std::format("Результат майнера '{}' предъявлен для '{}'",
                        result.inputs.miner, miner)
        );
    }
    return {};
}

Result<void> ChainValidator::check_result_tip(const mining::MiningResult& result) const {
    const core::Block& current_tip = tip();
    if (result.inputs.previous_hash != current_tip.hash ||
        result.inputs.block_index != current_tip.index + 1) {
        return Err<void>(
            ErrorCode::HashMismatch,
            std::format("Результат для блока {} на {}, вершина: блок {} {}",
                        result.inputs.block_index, short_hex(result.inputs.previous_hash),
                        current_tip.index, short_hex(current_tip.hash))
        );
    }
    return {};
}

Result<void> ChainValidator::verify_mining_result(
    const mining::MiningEngine& engine,
    std::string_view miner,
    const mining::MiningResult& result
) {
    if (auto r = check_result_claim(miner, result); !r) {
        return r;
    }

    // Результат должен воспроизводиться из своих входных данных
    mining::MiningResult replay = engine.simulate(result.inputs);
    if (!replay.success || replay.rounds != result.rounds ||
        replay.games_played != result.games_played ||
        replay.min_games != result.min_games ||
        replay.players != result.players || replay.reward != result.reward) {
        return Err<void>(
            ErrorCode::InvalidMiningResult,
            std::format("Результат майнинга блока {} не воспроизводится",
                        result.inputs.block_index)
        );
    }
    if (result.reward == 0) {
        return Err<void>(
            ErrorCode::InvalidMiningResult,
            std::format("Нулевая награда при {} играх", result.games_played)
        );
    }
    return {};
}

Result<core::Block> ChainValidator::append(
    std::string_view miner,
    std::span<const core::Transaction> pending,
    const mining::MiningResult& result
) {
    // Устаревший результат отклоняется до дорогого воспроизведения
    if (auto r = check_result_claim(miner, result); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = check_result_tip(result); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = verify_mining_result(engine_, miner, result); !r) {
        return std::unexpected(r.error());
    }
    return commit(miner, pending, result);
}

Result<core::Block> ChainValidator::append_verified(
    std::string_view miner,
    std::span<const core::Transaction> pending,
    const mining::MiningResult& result
) {
    if (auto r = check_result_claim(miner, result); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = check_result_tip(result); !r) {
        return std::unexpected(r.error());
    }
    return commit(miner, pending, result);
}

Result<core::Block> ChainValidator::commit(
    std::string_view miner,
    std::span<const core::Transaction> pending,
    const mining::MiningResult& result
) {
    const core::Block& current_tip = tip();
    uint32_t next_index = current_tip.index + 1;

    // === Транзакции ===
    if (auto r = check_pending(pending); !r) {
        log::warn(COMPONENT, std::format("Блок {} отклонён: {}", next_index, r.error().message));
        return std::unexpected(r.error());
    }

    core::Block block;
    block.index = next_index;
    block.timestamp = time_source_();
    block.previous_hash = current_tip.hash;
    block.mining = result.to_metadata();
    block.transactions.assign(pending.begin(), pending.end());
    block.transactions.push_back(
        core::Transaction::make_mint(std::string(miner), result.reward, next_index));
    block.seal();

    if (auto r = ledger_.apply_block(block); !r) {
        return std::unexpected(r.error());
    }

    index_block(block);
    blocks_.push_back(block);

    log::info(COMPONENT, std::format("Блок {} {} добавлен: майнер '{}', игр {}/{}, транзакций {}",
                                     block.index, short_hex(block.hash), block.mining.miner,
                                     block.mining.games_played, block.mining.min_games,
                                     block.transactions.size()));
    return block;
}

// =============================================================================
// Валидация
// =============================================================================

ValidationReport ChainValidator::validate() const {
    return validate(blocks_, params_, &ledger_);
}

ValidationReport ChainValidator::validate(
    std::span<const core::Block> chain,
    const ChainParams& params,
    const ledger::Ledger* cached
) {
    ValidationReport report;
    report.blocks_checked = chain.size();

    auto add = [&report](uint32_t index, ErrorCode code, std::string message) {
        report.issues.push_back({index, code, std::move(message)});
    };

    if (chain.empty()) {
        add(0, ErrorCode::BrokenLink, "Цепь пуста: нет genesis блока");
        return report;
    }

    mining::MiningEngine engine(params.max_rounds);
    ledger::Ledger replay;
    bool replay_ok = true;

    for (std::size_t pos = 0; pos < chain.size(); ++pos) {
        const core::Block& block = chain[pos];
        uint32_t index = block.index;

        if (index != pos) {
            add(index, ErrorCode::BrokenLink,
                std::format("Индекс {} на позиции {}", index, pos));
        }

        if (block.compute_merkle_root() != block.merkle_root) {
            add(index, ErrorCode::MerkleRootMismatch,
                std::format("Merkle root {} не совпадает с транзакциями",
                            short_hex(block.merkle_root)));
        }

        if (block.compute_hash() != block.hash) {
            add(index, ErrorCode::HashMismatch,
                std::format("Хеш {} не совпадает с содержимым", short_hex(block.hash)));
        }

        const Hash256& expected_prev =
            pos == 0 ? core::genesis_previous_hash() : chain[pos - 1].hash;
        if (block.previous_hash != expected_prev) {
            add(index, ErrorCode::BrokenLink,
                std::format("previous_hash {}, ожидался {}",
                            short_hex(block.previous_hash), short_hex(expected_prev)));
        }

        if (auto r = check_mint_placement(block); !r) {
            add(index, r.error().code, r.error().message);
        } else if (!block.is_genesis() && params.verify_mining_on_validate) {
            if (auto v = engine.verify(block); !v) {
                add(index, v.error().code, v.error().message);
            }
        }

        // После первой ошибки состояние ledger не определено
        if (replay_ok) {
            if (auto r = replay.apply_block(block); !r) {
                add(index, ErrorCode::LedgerInconsistency, r.error().message);
                replay_ok = false;
            }
        }
    }

    if (replay_ok && cached != nullptr && *cached != replay) {
        add(chain.back().index, ErrorCode::LedgerInconsistency,
            "Кэшированный ledger расходится с воспроизведённым");
    }

    if (report.valid()) {
        log::debug(COMPONENT, std::format("Цепь из {} блоков корректна", chain.size()));
    } else {
        log::warn(COMPONENT, std::format("Цепь некорректна: {} нарушений", report.issues.size()));
    }
    return report;
}

// =============================================================================
// Поиск
// =============================================================================

Result<core::Block> ChainValidator::block_at(uint32_t index) const {
    if (index >= blocks_.size()) {
        return Err<core::Block>(
            ErrorCode::BlockNotFound,
            std::format("Блок {} не найден, высота {}", index, blocks_.size())
        );
    }
    return blocks_[index];
}

Result<core::Block> ChainValidator::block_by_hash(const Hash256& hash) const {
    auto it = block_index_.find(hash);
    if (it == block_index_.end()) {
        return Err<core::Block>(
            ErrorCode::BlockNotFound,
            std::format("Блок {} не найден", to_hex(hash))
        );
    }
    return blocks_[it->second];
}

Result<TxLocation> ChainValidator::find_transaction(const Hash256& txid) const {
    auto it = tx_index_.find(txid);
    if (it == tx_index_.end()) {
        return Err<TxLocation>(
            ErrorCode::TransactionNotFound,
            std::format("Транзакция {} не найдена", to_hex(txid))
        );
    }

    const auto& [block_index, tx_index] = it->second;
    return TxLocation{block_index, tx_index, blocks_[block_index].transactions[tx_index]};
}

Result<InclusionProof> ChainValidator::prove_transaction(const Hash256& txid) const {
    auto location = find_transaction(txid);
    if (!location) {
        return std::unexpected(location.error());
    }

    const core::Block& block = blocks_[location->block_index];
    auto proof = core::prove_inclusion(block.txids(), location->tx_index);
    if (!proof) {
        return std::unexpected(proof.error());
    }

    InclusionProof result;
    result.block_index = location->block_index;
    result.tx_index = location->tx_index;
    result.txid = txid;
    result.proof = std::move(*proof);
    result.merkle_root = block.merkle_root;
    return result;
}

std::vector<AccountEntry> ChainValidator::account_history(std::string_view account) const {
    std::vector<AccountEntry> history;
    for (const auto& block : blocks_) {
        for (const auto& tx : block.transactions) {
            if (tx.sender == account || tx.receiver == account) {
                history.push_back({block.index, block.timestamp, tx});
            }
        }
    }
    return history;
}

} // namespace phlop::chain
