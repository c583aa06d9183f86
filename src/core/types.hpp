/**
 * @file types.hpp
 * @brief Базовые типы для PhlopChain
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный хеш (SHA256, block hash, txid, merkle root)
 * - Bytes: динамический массив байт
 * - Amount: сумма в минимальных единицах PhlopCoin
 * - Result<T>: обёртка std::expected для обработки ошибок
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace phlop {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Используется для:
 * - Block hash
 * - Transaction ID (txid)
 * - Merkle root и узлов дерева
 * - Seed майнинга
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Динамический массив байт
 *
 * Используется для канонической сериализации транзакций и блоков.
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

/**
 * @brief Сумма в минимальных единицах (1 PhlopCoin = 10^12 единиц)
 */
using Amount = uint64_t;

// =============================================================================
// Коды ошибок PhlopChain
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Ошибки ядра возвращаются явно через Result<T>, исключения
 * не пересекают границу API.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки ledger (200-299)
    InsufficientFunds = 200,
    InvalidNonce = 201,
    BalanceOverflow = 202,

    // Ошибки транзакций и цепи (300-399)
    InvalidTransaction = 300,
    HashMismatch = 301,
    BlockNotFound = 302,
    TransactionNotFound = 303,

    // Ошибки майнинга (400-499)
    MiningFailed = 400,
    InvalidMiningResult = 401,

    // Результаты валидации цепи (500-599)
    MerkleRootMismatch = 500,
    BrokenLink = 501,
    LedgerInconsistency = 502,
    MiningProofMismatch = 503,

    // Ошибки Merkle (600-699)
    IndexOutOfRange = 600,

    // Ошибки сериализации (700-799)
    DeserializationFailed = 700,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::InsufficientFunds: return "Недостаточно средств";
        case ErrorCode::InvalidNonce: return "Некорректный nonce отправителя";
        case ErrorCode::BalanceOverflow: return "Переполнение баланса";
        case ErrorCode::InvalidTransaction: return "Некорректная транзакция";
        case ErrorCode::HashMismatch: return "Хеш не совпадает";
        case ErrorCode::BlockNotFound: return "Блок не найден";
        case ErrorCode::TransactionNotFound: return "Транзакция не найдена";
        case ErrorCode::MiningFailed: return "Майнинг превысил лимит раундов";
        case ErrorCode::InvalidMiningResult: return "Некорректный результат майнинга";
        case ErrorCode::MerkleRootMismatch: return "Merkle root не совпадает";
        case ErrorCode::BrokenLink: return "Нарушена связь с предыдущим блоком";
        case ErrorCode::LedgerInconsistency: return "Состояние ledger не воспроизводится";
        case ErrorCode::MiningProofMismatch: return "Доказательство майнинга не воспроизводится";
        case ErrorCode::IndexOutOfRange: return "Индекс вне диапазона";
        case ErrorCode::DeserializationFailed: return "Ошибка десериализации";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * Пример использования:
 * @code
 * auto result = ledger.apply(tx);
 * if (!result) {
 *     std::cerr << result.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/**
 * @brief Concept для байтовых контейнеров
 */
template<typename T>
concept ByteContainer = requires(T t) {
    { t.data() } -> std::convertible_to<const uint8_t*>;
    { t.size() } -> std::convertible_to<std::size_t>;
};

/**
 * @brief Представить строку как байты без копирования
 */
[[nodiscard]] inline ByteSpan as_bytes(std::string_view str) noexcept {
    return ByteSpan{reinterpret_cast<const uint8_t*>(str.data()), str.size()};
}

} // namespace phlop
