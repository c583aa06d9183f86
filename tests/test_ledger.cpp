/**
 * @file test_ledger.cpp
 * @brief Тесты ledger: балансы, nonce, mint и перестроение из цепи
 */

#include <gtest/gtest.h>

#include "ledger/ledger.hpp"
#include "core/primitives/block.hpp"
#include "core/primitives/transaction.hpp"
#include "core/constants.hpp"
#include "crypto/hash_commit.hpp"

#include <limits>
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

core::Block make_block(uint32_t index, std::vector<core::Transaction> txs) {
    core::Block block;
    block.index = index;
    block.transactions = std::move(txs);
    block.seal();
    return block;
}

} // namespace

/**
 * @brief Класс тестов ledger
 */
class LedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(ledger_.apply(core::Transaction::make_mint("alice", 100, 0)).has_value());
        ASSERT_TRUE(ledger_.apply(core::Transaction::make_mint("bob", 5, 1)).has_value());
    }

    ledger::Ledger ledger_;
};

/**
 * @brief Тест: неизвестный счёт имеет нулевой баланс и nonce
 */
TEST_F(LedgerTest, UnknownAccount) {
    EXPECT_EQ(ledger_.balance_of("carol"), 0u);
    EXPECT_EQ(ledger_.nonce_of("carol"), 0u);
}

/**
 * @brief Тест: mint увеличивает баланс и эмиссию, nonce не трогает
 */
TEST_F(LedgerTest, MintCreditsReceiver) {
    EXPECT_EQ(ledger_.balance_of("alice"), 100u);
    EXPECT_EQ(ledger_.balance_of("bob"), 5u);
    EXPECT_EQ(ledger_.total_supply(), 105u);
    EXPECT_EQ(ledger_.nonce_of("alice"), 0u);
    EXPECT_EQ(ledger_.balance_of(constants::COINBASE_SENDER), 0u);
}

/**
 * @brief Тест: перевод списывает, зачисляет и продвигает nonce
 */
TEST_F(LedgerTest, TransferMovesFunds) {
    ASSERT_TRUE(ledger_.apply(transfer("alice", "bob", 30, 1)).has_value());
    EXPECT_EQ(ledger_.balance_of("alice"), 70u);
    EXPECT_EQ(ledger_.balance_of("bob"), 35u);
    EXPECT_EQ(ledger_.nonce_of("alice"), 1u);
    EXPECT_EQ(ledger_.total_supply(), 105u);

    ASSERT_TRUE(ledger_.apply(transfer("alice", "carol", 70, 2)).has_value());
    EXPECT_EQ(ledger_.balance_of("alice"), 0u);
    EXPECT_EQ(ledger_.balance_of("carol"), 70u);
}

/**
 * @brief Тест: недостаточно средств, состояние не меняется
 */
TEST_F(LedgerTest, InsufficientFundsLeavesStateUnchanged) {
    const auto before = ledger_;

    auto r = ledger_.apply(transfer("bob", "alice", 10, 1));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InsufficientFunds);

    EXPECT_EQ(ledger_.balance_of("bob"), 5u);
    EXPECT_EQ(ledger_.balance_of("alice"), 100u);
    EXPECT_EQ(ledger_, before);
}

/**
 * @brief Тест: nonce должен быть ровно на единицу больше предыдущего
 */
TEST_F(LedgerTest, NonceMustBeNext) {
    auto replay = ledger_.apply(transfer("alice", "bob", 1, 0));
    ASSERT_FALSE(replay.has_value());
    EXPECT_EQ(replay.error().code, ErrorCode::InvalidNonce);

    auto gap = ledger_.apply(transfer("alice", "bob", 1, 2));
    ASSERT_FALSE(gap.has_value());
    EXPECT_EQ(gap.error().code, ErrorCode::InvalidNonce);

    ASSERT_TRUE(ledger_.apply(transfer("alice", "bob", 1, 1)).has_value());

    auto reused = ledger_.apply(transfer("alice", "bob", 1, 1));
    ASSERT_FALSE(reused.has_value());
    EXPECT_EQ(reused.error().code, ErrorCode::InvalidNonce);
}

/**
 * @brief Тест: nonce проверяется раньше баланса
 */
TEST_F(LedgerTest, NonceCheckedBeforeBalance) {
    auto r = ledger_.check(transfer("bob", "alice", 1'000, 5));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidNonce);
}

/**
 * @brief Тест: структурно неверная транзакция
 */
TEST_F(LedgerTest, StructureErrors) {
    auto self = ledger_.check(transfer("alice", "alice", 1, 1));
    ASSERT_FALSE(self.has_value());
    EXPECT_EQ(self.error().code, ErrorCode::InvalidTransaction);

    auto zero_mint = ledger_.check(core::Transaction::make_mint("alice", 0, 0));
    ASSERT_FALSE(zero_mint.has_value());
    EXPECT_EQ(zero_mint.error().code, ErrorCode::InvalidTransaction);
}

/**
 * @brief Тест: переполнение эмиссии отклоняется
 */
TEST_F(LedgerTest, MintOverflow) {
    auto huge = core::Transaction::make_mint("carol", std::numeric_limits<Amount>::max(), 0);
    auto r = ledger_.apply(huge);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::BalanceOverflow);
    EXPECT_EQ(ledger_.balance_of("carol"), 0u);
    EXPECT_EQ(ledger_.total_supply(), 105u);
}

/**
 * @brief Тест: блок применяется атомарно
 */
TEST_F(LedgerTest, ApplyBlockIsAtomic) {
    const auto before = ledger_;

    auto block = make_block(1, {
        transfer("alice", "bob", 10, 1),
        transfer("bob", "carol", 100, 1),
    });

    auto r = ledger_.apply_block(block);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InsufficientFunds);
    EXPECT_EQ(ledger_, before);
}

/**
 * @brief Тест: транзакции внутри блока видят результат предыдущих
 */
TEST_F(LedgerTest, ApplyBlockSequential) {
    auto block = make_block(1, {
        transfer("bob", "carol", 5, 1),
        transfer("carol", "dave", 5, 1),
        core::Transaction::make_mint("miner", 7, 1),
    });

    ASSERT_TRUE(ledger_.apply_block(block).has_value());
    EXPECT_EQ(ledger_.balance_of("bob"), 0u);
    EXPECT_EQ(ledger_.balance_of("carol"), 0u);
    EXPECT_EQ(ledger_.balance_of("dave"), 5u);
    EXPECT_EQ(ledger_.balance_of("miner"), 7u);
    EXPECT_EQ(ledger_.total_supply(), 112u);
}

/**
 * @brief Тест: перестроение из цепи совпадает с инкрементальным применением
 */
TEST_F(LedgerTest, RebuildMatchesIncremental) {
    std::vector<core::Block> chain = {
        make_block(0, {
            core::Transaction::make_mint("alice", 100, 0),
            core::Transaction::make_mint("bob", 5, 1),
        }),
        make_block(1, {
            transfer("alice", "bob", 40, 1),
            core::Transaction::make_mint("miner", 3, 1),
        }),
        make_block(2, {
            transfer("bob", "carol", 45, 1),
            transfer("alice", "carol", 60, 2),
            core::Transaction::make_mint("miner", 2, 2),
        }),
    };

    ledger::Ledger incremental;
    for (const auto& block : chain) {
        ASSERT_TRUE(incremental.apply_block(block).has_value());
    }

    ledger::Ledger rebuilt;
    ASSERT_TRUE(rebuilt.rebuild_from(chain).has_value());
    EXPECT_EQ(rebuilt, incremental);
    EXPECT_EQ(rebuilt.state_root(), incremental.state_root());

    ledger::Ledger again;
    ASSERT_TRUE(again.rebuild_from(chain).has_value());
    EXPECT_EQ(again, rebuilt);

    EXPECT_EQ(rebuilt.balance_of("carol"), 105u);
    EXPECT_EQ(rebuilt.balance_of("miner"), 5u);
    EXPECT_EQ(rebuilt.nonce_of("alice"), 2u);
}

/**
 * @brief Тест: неудачное перестроение оставляет ledger без изменений
 */
TEST_F(LedgerTest, RebuildFailureKeepsState) {
    const auto before = ledger_;
    std::vector<core::Block> chain = {
        make_block(0, {transfer("nobody", "alice", 1, 1)}),
    };

    auto r = ledger_.rebuild_from(chain);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InsufficientFunds);
    EXPECT_EQ(ledger_, before);
}

/**
 * @brief Тест: state_root зависит от балансов
 */
TEST_F(LedgerTest, StateRoot) {
    auto root = ledger_.state_root();
    EXPECT_EQ(root, ledger_.state_root());

    ASSERT_TRUE(ledger_.apply(transfer("alice", "bob", 1, 1)).has_value());
    EXPECT_NE(ledger_.state_root(), root);

    ledger_.reset();
    EXPECT_EQ(ledger_.state_root(), crypto::empty_digest());
    EXPECT_EQ(ledger_.total_supply(), 0u);
}

// =============================================================================
// LedgerOverlay
// =============================================================================

/**
 * @brief Тест: overlay видит свои изменения и не трогает базу
 */
TEST_F(LedgerTest, OverlayProjectsWithoutTouchingBase) {
    const ledger::Ledger before = ledger_;

    ledger::LedgerOverlay overlay(ledger_);
    ASSERT_TRUE(overlay.apply(transfer("alice", "carol", 60, 1)).has_value());
    ASSERT_TRUE(overlay.apply(transfer("carol", "bob", 10, 1)).has_value());

    EXPECT_EQ(overlay.balance_of("alice"), 40u);
    EXPECT_EQ(overlay.balance_of("carol"), 50u);
    EXPECT_EQ(overlay.balance_of("bob"), 15u);
    EXPECT_EQ(overlay.nonce_of("alice"), 1u);
    EXPECT_EQ(overlay.touched(), 3u);

    // Второй перевод проверяется против проекции, а не базы
    auto overspend = overlay.check(transfer("alice", "bob", 50, 2));
    ASSERT_FALSE(overspend.has_value());
    EXPECT_EQ(overspend.error().code, ErrorCode::InsufficientFunds);

    auto replayed = overlay.apply(transfer("alice", "bob", 1, 1));
    ASSERT_FALSE(replayed.has_value());
    EXPECT_EQ(replayed.error().code, ErrorCode::InvalidNonce);

    EXPECT_EQ(ledger_, before);
    EXPECT_EQ(ledger_.balance_of("carol"), 0u);
}

/**
 * @brief Тест: commit_to даёт тот же ledger, что последовательный apply
 */
TEST_F(LedgerTest, OverlayCommitMatchesSequentialApply) {
    std::vector<core::Transaction> txs = {
        transfer("alice", "carol", 60, 1),
        core::Transaction::make_mint("dave", 7, 2),
        transfer("bob", "alice", 5, 1),
        transfer("carol", "dave", 60, 1),
    };

    ledger::Ledger sequential = ledger_;
    ledger::LedgerOverlay overlay(ledger_);
    for (const auto& tx : txs) {
        ASSERT_TRUE(sequential.apply(tx).has_value());
        ASSERT_TRUE(overlay.apply(tx).has_value());
    }
    std::move(overlay).commit_to(ledger_);

    EXPECT_EQ(ledger_, sequential);
    EXPECT_EQ(ledger_.balance_of("carol"), 0u);
    EXPECT_EQ(ledger_.total_supply(), 112u);
    EXPECT_EQ(ledger_.state_root(), sequential.state_root());
}

} // namespace phlop::tests
