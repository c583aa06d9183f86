/**
 * @file ledger.cpp
 * @brief Реализация ledger
 */

#include "ledger.hpp"
#include "../core/constants.hpp"
#include "../core/primitives/merkle.hpp"
#include "../crypto/hash_commit.hpp"

#include <format>
#include <limits>
#include <vector>

namespace phlop::ledger {

namespace {

[[nodiscard]] bool add_overflows(Amount a, Amount b) noexcept {
    return a > std::numeric_limits<Amount>::max() - b;
}

Result<void> check_mint(const core::Transaction& tx) {
    if (tx.receiver.empty()) {
        return Err<void>(ErrorCode::InvalidTransaction, "Mint без получателя");
    }
    if (tx.receiver == constants::COINBASE_SENDER) {
        return Err<void>(ErrorCode::InvalidTransaction, "Mint самому coinbase");
    }
    if (tx.amount == 0) {
        return Err<void>(ErrorCode::InvalidTransaction, "Mint нулевой суммы");
    }
    return {};
}

/**
 * @brief Правила применения транзакции к состоянию
 *
 * State: balance_of, nonce_of, total_supply (Ledger или LedgerOverlay).
 */
template<typename State>
Result<void> check_against(const State& state, const core::Transaction& tx) {
    if (tx.is_mint()) {
        if (auto r = check_mint(tx); !r) {
            return r;
        }
        if (add_overflows(state.total_supply(), tx.amount)) {
            return Err<void>(
                ErrorCode::BalanceOverflow,
                std::format("Mint {} переполняет эмиссию", tx.amount)
            );
        }
        return {};
    }

    if (auto r = tx.validate_structure(); !r) {
        return r;
    }

    uint64_t expected_nonce = state.nonce_of(tx.sender) + 1;
    if (tx.nonce != expected_nonce) {
        return Err<void>(
            ErrorCode::InvalidNonce,
            std::format("Отправитель '{}': nonce {}, ожидался {}",
                        tx.sender, tx.nonce, expected_nonce)
        );
    }

    Amount sender_balance = state.balance_of(tx.sender);
    if (sender_balance < tx.amount) {
        return Err<void>(
            ErrorCode::InsufficientFunds,
            std::format("Отправитель '{}': баланс {}, требуется {}",
                        tx.sender, sender_balance, tx.amount)
        );
    }

    if (add_overflows(state.balance_of(tx.receiver), tx.amount)) {
        return Err<void>(
            ErrorCode::BalanceOverflow,
            std::format("Получатель '{}': переполнение баланса", tx.receiver)
        );
    }
    return {};
}

} // namespace

Result<void> Ledger::check(const core::Transaction& tx) const {
    return check_against(*this, tx);
}

Result<void> Ledger::apply(const core::Transaction& tx) {
    if (auto r = check(tx); !r) {
        return r;
    }

    if (tx.is_mint()) {
        total_supply_ += tx.amount;
    } else {
        balances_[tx.sender] -= tx.amount;
        nonces_[tx.sender] = tx.nonce;
    }
    balances_[tx.receiver] += tx.amount;
    return {};
}

Result<void> Ledger::apply_block(const core::Block& block) {
    LedgerOverlay overlay(*this);
    for (std::size_t i = 0; i < block.transactions.size(); ++i) {
        if (auto r = overlay.apply(block.transactions[i]); !r) {
            return Err<void>(
                r.error().code,
                std::format("Блок {}, транзакция {}: {}", block.index, i, r.error().message)
            );
        }
    }
    std::move(overlay).commit_to(*this);
    return {};
}

Result<void> Ledger::rebuild_from(std::span<const core::Block> chain) {
    Ledger replay;
    for (const auto& block : chain) {
        if (auto r = replay.apply_block(block); !r) {
            return r;
        }
    }
    *this = std::move(replay);
    return {};
}

Amount Ledger::balance_of(std::string_view account) const {
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : 0;
}

uint64_t Ledger::nonce_of(std::string_view account) const {
    auto it = nonces_.find(account);
    return it != nonces_.end() ? it->second : 0;
}

Hash256 Ledger::state_root() const {
    std::vector<Hash256> leaves;
    leaves.reserve(balances_.size());
    for (const auto& [account, balance] : balances_) {
        leaves.push_back(crypto::digest(std::format("{}:{}", account, balance)));
    }
    return core::compute_merkle_root(leaves);
}

void Ledger::reset() noexcept {
    balances_.clear();
    nonces_.clear();
    total_supply_ = 0;
}

// =============================================================================
// LedgerOverlay
// =============================================================================

LedgerOverlay::LedgerOverlay(const Ledger& base) noexcept
    : base_(&base)
    , total_supply_(base.total_supply())
{
}

Result<void> LedgerOverlay::check(const core::Transaction& tx) const {
    return check_against(*this, tx);
}

Result<void> LedgerOverlay::apply(const core::Transaction& tx) {
    if (auto r = check(tx); !r) {
        return r;
    }

    if (tx.is_mint()) {
        total_supply_ += tx.amount;
    } else {
        balances_[tx.sender] = balance_of(tx.sender) - tx.amount;
        nonces_[tx.sender] = tx.nonce;
    }
    Amount received = balance_of(tx.receiver) + tx.amount;
    balances_[tx.receiver] = received;
    return {};
}

Amount LedgerOverlay::balance_of(std::string_view account) const {
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : base_->balance_of(account);
}

uint64_t LedgerOverlay::nonce_of(std::string_view account) const {
    auto it = nonces_.find(account);
    return it != nonces_.end() ? it->second : base_->nonce_of(account);
}

void LedgerOverlay::commit_to(Ledger& target) && {
    for (auto& [account, balance] : balances_) {
        target.balances_[account] = balance;
    }
    for (auto& [account, nonce] : nonces_) {
        target.nonces_[account] = nonce;
    }
    target.total_supply_ = total_supply_;
    balances_.clear();
    nonces_.clear();
}

} // namespace phlop::ledger
