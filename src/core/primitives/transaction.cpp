/**
 * @file transaction.cpp
 * @brief Реализация транзакции
 */

#include "transaction.hpp"
#include "../constants.hpp"
#include "../serialization/stream.hpp"
#include "../../crypto/hash_commit.hpp"

#include <format>

namespace phlop::core {

bool Transaction::is_mint() const noexcept {
    return sender == constants::COINBASE_SENDER;
}

Transaction Transaction::make_mint(std::string receiver, Amount amount, uint64_t nonce) {
    Transaction tx;
    tx.sender = std::string(constants::COINBASE_SENDER);
    tx.receiver = std::move(receiver);
    tx.amount = amount;
    tx.nonce = nonce;
    return tx;
}

void Transaction::write_to(serialization::WriteStream& out) const {
    out.write_string(sender);
    out.write_string(receiver);
    out.write_u64(amount);
    out.write_u64(nonce);
}

Transaction Transaction::read_from(serialization::ReadStream& in) {
    Transaction tx;
    tx.sender = in.read_string();
    tx.receiver = in.read_string();
    tx.amount = in.read_u64();
    tx.nonce = in.read_u64();
    return tx;
}

Bytes Transaction::serialize() const {
    serialization::WriteStream out(sender.size() + receiver.size() + 18);
    write_to(out);
    return out.take_data();
}

Hash256 Transaction::txid() const {
    Bytes data = serialize();
    return crypto::digest(ByteSpan{data});
}

Result<void> Transaction::validate_structure() const {
    if (sender.empty()) {
        return Err<void>(ErrorCode::InvalidTransaction, "Пустой отправитель");
    }
    if (receiver.empty()) {
        return Err<void>(ErrorCode::InvalidTransaction, "Пустой получатель");
    }
    if (sender == receiver) {
        return Err<void>(
            ErrorCode::InvalidTransaction,
            std::format("Перевод самому себе: {}", sender)
        );
    }
    if (amount == 0) {
        return Err<void>(ErrorCode::InvalidTransaction, "Нулевая сумма");
    }
    if (receiver == constants::COINBASE_SENDER) {
        return Err<void>(
            ErrorCode::InvalidTransaction,
            std::format("Получатель не может быть '{}'", constants::COINBASE_SENDER)
        );
    }
    return {};
}

} // namespace phlop::core
