/**
 * @file test_chain_validator.cpp
 * @brief Тесты цепи: genesis, добавление блоков, валидация и поиск
 */

#include <gtest/gtest.h>

#include "chain/chain_validator.hpp"
#include "core/config.hpp"
#include "crypto/hash_commit.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

namespace phlop::tests {

namespace {

core::Transaction transfer(std::string from, std::string to, Amount amount, uint64_t nonce) {
    core::Transaction tx;
    tx.sender = std::move(from);
    tx.receiver = std::move(to);
    tx.amount = amount;
    tx.nonce = nonce;
    return tx;
}

} // namespace

/**
 * @brief Класс тестов ChainValidator
 */
class ChainValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        params_.genesis_timestamp = 1'700'000'000;
        params_.genesis_allocations = {
            {"genesis", 1'000'000},
            {"alice", 1'000},
            {"bob", 500},
        };
        params_.max_transactions_per_block = 3;
        validator_ = std::make_unique<chain::ChainValidator>(params_);

        clock_ = params_.genesis_timestamp;
        validator_->set_time_source([this]() { return clock_ += 60; });
    }

    /**
     * @brief Добыть следующий блок с указанными транзакциями
     */
    core::Block mine_block(const std::string& miner, std::vector<core::Transaction> txs = {}) {
        auto result = validator_->engine().mine(validator_->next_seed_inputs(miner, 0));
        EXPECT_TRUE(result.has_value());
        auto block = validator_->append(miner, txs, *result);
        EXPECT_TRUE(block.has_value()) << block.error().message;
        return block.value_or(core::Block{});
    }

    chain::ChainParams params_;
    std::unique_ptr<chain::ChainValidator> validator_;
    int64_t clock_{0};
};

// =============================================================================
// Genesis
// =============================================================================

/**
 * @brief Тест: genesis содержит mint для каждого начального счёта
 */
TEST_F(ChainValidatorTest, GenesisBlock) {
    ASSERT_EQ(validator_->size(), 1u);
    const auto& genesis = validator_->tip();

    EXPECT_EQ(genesis.index, 0u);
    EXPECT_EQ(genesis.timestamp, params_.genesis_timestamp);
    EXPECT_EQ(genesis.previous_hash, core::genesis_previous_hash());
    ASSERT_EQ(genesis.transactions.size(), 3u);
    for (std::size_t i = 0; i < genesis.transactions.size(); ++i) {
        EXPECT_TRUE(genesis.transactions[i].is_mint());
        EXPECT_EQ(genesis.transactions[i].nonce, i);
    }

    EXPECT_EQ(validator_->ledger().balance_of("alice"), 1'000u);
    EXPECT_EQ(validator_->ledger().total_supply(), 1'001'500u);
    EXPECT_EQ(genesis, chain::make_genesis_block(params_));
    EXPECT_TRUE(validator_->validate().valid());
}

/**
 * @brief Тест: genesis без счетов проходит проверку
 */
TEST_F(ChainValidatorTest, EmptyGenesis) {
    chain::ChainParams empty;
    chain::ChainValidator validator(empty);
    EXPECT_TRUE(validator.tip().transactions.empty());
    EXPECT_EQ(validator.tip().merkle_root, crypto::empty_digest());
    EXPECT_TRUE(validator.validate().valid());
}

/**
 * @brief Тест: некорректный genesis счёт
 */
TEST_F(ChainValidatorTest, InvalidGenesisThrows) {
    chain::ChainParams bad;
    bad.genesis_allocations = {{"alice", 0}};
    EXPECT_THROW(chain::ChainValidator{bad}, std::invalid_argument);
}

/**
 * @brief Тест: параметры из конфигурации переводят балансы в минимальные единицы
 */
TEST_F(ChainValidatorTest, ParamsFromConfig) {
    Config config;
    auto params = chain::ChainParams::from_config(config);
    ASSERT_EQ(params.genesis_allocations.size(), 3u);
    EXPECT_EQ(params.genesis_allocations[1].account, "alice");
    EXPECT_EQ(params.genesis_allocations[1].amount, 1'000 * constants::UNITS_PER_PHLOP);
    EXPECT_EQ(params.max_rounds, config.mining.max_rounds);
}

// =============================================================================
// Добавление блоков
// =============================================================================

/**
 * @brief Тест: блок с переводом и наградой
 */
TEST_F(ChainValidatorTest, AppendBlock) {
    auto tx = transfer("alice", "bob", 100, 1);
    auto block = mine_block("miner", {tx});

    EXPECT_EQ(block.index, 1u);
    EXPECT_EQ(block.previous_hash, validator_->blocks()[0].hash);
    EXPECT_EQ(block.timestamp, params_.genesis_timestamp + 60);
    ASSERT_EQ(block.transactions.size(), 2u);
    EXPECT_EQ(block.transactions[0], tx);

    const auto& mint = block.transactions.back();
    EXPECT_TRUE(mint.is_mint());
    EXPECT_EQ(mint.receiver, "miner");
    EXPECT_EQ(mint.amount, block.mining.reward);
    EXPECT_EQ(mint.nonce, 1u);
    EXPECT_GT(block.mining.reward, 0u);
    EXPECT_EQ(block.mining.difficulty, 1u);
    EXPECT_EQ(block.mining.min_games, 101u);

    const auto& ledger = validator_->ledger();
    EXPECT_EQ(ledger.balance_of("alice"), 900u);
    EXPECT_EQ(ledger.balance_of("bob"), 600u);
    EXPECT_EQ(ledger.balance_of("miner"), block.mining.reward);
    EXPECT_EQ(ledger.nonce_of("alice"), 1u);

    EXPECT_TRUE(validator_->validate().valid());
}

/**
 * @brief Тест: несколько блоков подряд образуют корректную цепь
 */
TEST_F(ChainValidatorTest, ChainOfBlocks) {
    mine_block("alice");
    mine_block("bob", {transfer("alice", "bob", 1, 1)});
    mine_block("alice", {transfer("bob", "carol", 2, 1), transfer("alice", "carol", 3, 2)});

    ASSERT_EQ(validator_->size(), 4u);
    for (std::size_t i = 1; i < validator_->size(); ++i) {
        EXPECT_EQ(validator_->blocks()[i].previous_hash, validator_->blocks()[i - 1].hash);
        EXPECT_EQ(validator_->blocks()[i].index, i);
    }

    auto report = validator_->validate();
    EXPECT_TRUE(report.valid()) << report.summary();
    EXPECT_EQ(report.blocks_checked, 4u);

    ledger::Ledger rebuilt;
    ASSERT_TRUE(rebuilt.rebuild_from(validator_->blocks()).has_value());
    EXPECT_EQ(rebuilt, validator_->ledger());
}

/**
 * @brief Тест: результат для старой вершины отклоняется с HashMismatch
 */
TEST_F(ChainValidatorTest, StaleResultRejected) {
    auto stale = validator_->engine().mine(validator_->next_seed_inputs("bob", 0));
    ASSERT_TRUE(stale.has_value());

    mine_block("alice");

    auto r = validator_->append("bob", {}, *stale);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::HashMismatch);
    EXPECT_EQ(validator_->size(), 2u);
}

/**
 * @brief Тест: неуспешный результат и чужой майнер
 */
TEST_F(ChainValidatorTest, InvalidMiningResult) {
    mining::MiningEngine strict(1);
    auto failed = strict.simulate(validator_->next_seed_inputs("alice", 0));
    ASSERT_FALSE(failed.success);

    auto r = validator_->append("alice", {}, failed);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidMiningResult);

    auto good = validator_->engine().mine(validator_->next_seed_inputs("alice", 0));
    ASSERT_TRUE(good.has_value());
    auto wrong_miner = validator_->append("bob", {}, *good);
    ASSERT_FALSE(wrong_miner.has_value());
    EXPECT_EQ(wrong_miner.error().code, ErrorCode::InvalidMiningResult);

    auto forged = *good;
    forged.games_played -= 1;
    auto rejected = validator_->append("alice", {}, forged);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::InvalidMiningResult);

    EXPECT_EQ(validator_->size(), 1u);
}

/**
 * @brief Тест: проверка результата отдельно от фиксации блока
 */
TEST_F(ChainValidatorTest, VerifyThenAppendVerified) {
    auto result = validator_->engine().mine(validator_->next_seed_inputs("alice", 0));
    ASSERT_TRUE(result.has_value());

    // Проверка не требует экземпляра цепи
    mining::MiningEngine engine(params_.max_rounds);
    EXPECT_TRUE(chain::ChainValidator::verify_mining_result(engine, "alice", *result).has_value());

    auto forged = *result;
    forged.reward += 1;
    auto bad = chain::ChainValidator::verify_mining_result(engine, "alice", forged);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidMiningResult);

    auto foreign = chain::ChainValidator::verify_mining_result(engine, "bob", *result);
    ASSERT_FALSE(foreign.has_value());
    EXPECT_EQ(foreign.error().code, ErrorCode::InvalidMiningResult);

    auto block = validator_->append_verified("alice", {}, *result);
    ASSERT_TRUE(block.has_value()) << block.error().message;
    EXPECT_EQ(block->mining.games_played, result->games_played);
    EXPECT_TRUE(validator_->validate().valid());

    // Результат остаётся воспроизводимым, но вершина уже другая
    EXPECT_TRUE(chain::ChainValidator::verify_mining_result(engine, "alice", *result).has_value());
    auto stale = validator_->append_verified("alice", {}, *result);
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().code, ErrorCode::HashMismatch);
    EXPECT_EQ(validator_->size(), 2u);
}

/**
 * @brief Тест: pending транзакции проверяются до добавления блока
 */
TEST_F(ChainValidatorTest, PendingTransactionsChecked) {
    auto result = validator_->engine().mine(validator_->next_seed_inputs("miner", 0));
    ASSERT_TRUE(result.has_value());

    std::vector<core::Transaction> overspend = {transfer("bob", "alice", 501, 1)};
    auto r = validator_->append("miner", overspend, *result);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidTransaction);

    std::vector<core::Transaction> too_many = {
        transfer("alice", "bob", 1, 1),
        transfer("alice", "bob", 1, 2),
        transfer("alice", "bob", 1, 3),
        transfer("alice", "bob", 1, 4),
    };
    auto limit = validator_->check_pending(too_many);
    ASSERT_FALSE(limit.has_value());
    EXPECT_EQ(limit.error().code, ErrorCode::InvalidTransaction);

    std::vector<core::Transaction> with_mint = {core::Transaction::make_mint("miner", 1, 1)};
    auto mint = validator_->check_pending(with_mint);
    ASSERT_FALSE(mint.has_value());
    EXPECT_EQ(mint.error().code, ErrorCode::InvalidTransaction);

    // Цепь и ledger не изменились
    EXPECT_EQ(validator_->size(), 1u);
    EXPECT_EQ(validator_->ledger().balance_of("bob"), 500u);

    // Тот же результат подходит с корректными транзакциями
    auto ok = validator_->append("miner", std::vector{transfer("bob", "alice", 500, 1)}, *result);
    ASSERT_TRUE(ok.has_value()) << ok.error().message;
}

// =============================================================================
// Валидация
// =============================================================================

/**
 * @brief Тест: изменённая сумма перевода даёт MerkleRootMismatch
 */
TEST_F(ChainValidatorTest, TamperedAmountDetected) {
    mine_block("miner", {transfer("alice", "bob", 10, 1)});
    mine_block("miner");

    chain::Chain copy = validator_->blocks();
    copy[1].transactions[0].amount = 999;

    auto report = chain::ChainValidator::validate(copy, params_);
    EXPECT_FALSE(report.valid());
    EXPECT_TRUE(report.has(1, ErrorCode::MerkleRootMismatch));
    EXPECT_FALSE(report.has(2, ErrorCode::MerkleRootMismatch));
}

/**
 * @brief Тест: изменённый previous_hash даёт BrokenLink
 */
TEST_F(ChainValidatorTest, TamperedLinkDetected) {
    mine_block("miner");
    mine_block("miner");

    chain::Chain copy = validator_->blocks();
    copy[2].previous_hash = crypto::digest("elsewhere");

    auto report = chain::ChainValidator::validate(copy, params_);
    EXPECT_TRUE(report.has(2, ErrorCode::BrokenLink));
    EXPECT_TRUE(report.has(2, ErrorCode::HashMismatch));
}

/**
 * @brief Тест: пересчитанный хеш не скрывает подделку награды
 */
TEST_F(ChainValidatorTest, ResealedRewardDetected) {
    mine_block("miner");

    chain::Chain copy = validator_->blocks();
    copy[1].mining.reward += 1;
    copy[1].transactions.back().amount += 1;
    copy[1].seal();

    auto report = chain::ChainValidator::validate(copy, params_);
    EXPECT_TRUE(report.has(1, ErrorCode::MiningProofMismatch));
    EXPECT_FALSE(report.has(ErrorCode::MerkleRootMismatch));
}

/**
 * @brief Тест: mint не последней транзакцией
 */
TEST_F(ChainValidatorTest, MintPlacementChecked) {
    mine_block("miner", {transfer("alice", "bob", 10, 1)});

    chain::Chain copy = validator_->blocks();
    std::swap(copy[1].transactions[0], copy[1].transactions[1]);
    copy[1].seal();

    auto report = chain::ChainValidator::validate(copy, params_);
    EXPECT_TRUE(report.has(1, ErrorCode::MiningProofMismatch));
}

/**
 * @brief Тест: пустая цепь и неверный порядок индексов
 */
TEST_F(ChainValidatorTest, StructuralProblems) {
    auto empty = chain::ChainValidator::validate({}, params_);
    EXPECT_FALSE(empty.valid());

    mine_block("miner");
    chain::Chain copy = validator_->blocks();
    copy.erase(copy.begin());
    auto headless = chain::ChainValidator::validate(copy, params_);
    EXPECT_TRUE(headless.has(ErrorCode::BrokenLink));
}

/**
 * @brief Тест: без повторной симуляции подделка метаданных не обнаруживается
 */
TEST_F(ChainValidatorTest, MiningVerificationCanBeDisabled) {
    mine_block("miner");

    chain::Chain copy = validator_->blocks();
    copy[1].mining.rounds += 1;
    copy[1].seal();

    EXPECT_TRUE(chain::ChainValidator::validate(copy, params_).has(1, ErrorCode::MiningProofMismatch));

    auto relaxed = params_;
    relaxed.verify_mining_on_validate = false;
    EXPECT_TRUE(chain::ChainValidator::validate(copy, relaxed).valid());
}

// =============================================================================
// Поиск и доказательства
// =============================================================================

/**
 * @brief Тест: поиск блоков и транзакций
 */
TEST_F(ChainValidatorTest, Lookups) {
    auto tx = transfer("alice", "bob", 10, 1);
    auto block = mine_block("miner", {tx});

    auto by_index = validator_->block_at(1);
    ASSERT_TRUE(by_index.has_value());
    EXPECT_EQ(*by_index, block);

    auto by_hash = validator_->block_by_hash(block.hash);
    ASSERT_TRUE(by_hash.has_value());
    EXPECT_EQ(by_hash->index, 1u);

    auto missing = validator_->block_at(7);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::BlockNotFound);

    EXPECT_EQ(validator_->block_by_hash(crypto::digest("nope")).error().code,
              ErrorCode::BlockNotFound);

    auto location = validator_->find_transaction(tx.txid());
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(location->block_index, 1u);
    EXPECT_EQ(location->tx_index, 0u);
    EXPECT_EQ(location->tx, tx);

    EXPECT_EQ(validator_->find_transaction(crypto::digest("nope")).error().code,
              ErrorCode::TransactionNotFound);
}

/**
 * @brief Тест: доказательство включения проверяется против корня блока
 */
TEST_F(ChainValidatorTest, InclusionProof) {
    std::vector<core::Transaction> txs = {
        transfer("alice", "bob", 1, 1),
        transfer("alice", "bob", 2, 2),
        transfer("bob", "carol", 3, 1),
    };
    auto block = mine_block("miner", txs);

    for (const auto& tx : block.transactions) {
        auto proof = validator_->prove_transaction(tx.txid());
        ASSERT_TRUE(proof.has_value());
        EXPECT_EQ(proof->merkle_root, block.merkle_root);
        EXPECT_TRUE(proof->verify());
    }

    auto proof = validator_->prove_transaction(txs[1].txid());
    ASSERT_TRUE(proof.has_value());
    proof->txid = txs[0].txid();
    EXPECT_FALSE(proof->verify());
}

/**
 * @brief Тест: история счёта в порядке цепи
 */
TEST_F(ChainValidatorTest, AccountHistory) {
    mine_block("miner", {transfer("alice", "bob", 1, 1)});
    mine_block("miner", {transfer("bob", "alice", 1, 1)});

    auto history = validator_->account_history("alice");
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].block_index, 0u);
    EXPECT_TRUE(history[0].tx.is_mint());
    EXPECT_EQ(history[1].block_index, 1u);
    EXPECT_EQ(history[2].block_index, 2u);
    EXPECT_EQ(history[2].tx.sender, "bob");

    EXPECT_EQ(validator_->account_history("miner").size(), 2u);
    EXPECT_TRUE(validator_->account_history("nobody").empty());
}

} // namespace phlop::tests
