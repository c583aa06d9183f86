/**
 * @file status_reporter.hpp
 * @brief Репортёр статуса цепи
 *
 * Собирает состояние узла для вывода в терминал с ANSI форматированием:
 * - Высота цепи, всего сыграно игр, эмиссия
 * - Квота следующего блока
 * - Счётчики блоков по майнерам
 * - Кольцевой буфер событий
 */

#pragma once

#include "logger.hpp"
#include "../core/types.hpp"
#include "../core/config.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace phlop::log {

// =============================================================================
// Типы событий
// =============================================================================

/**
 * @brief Тип события для логирования
 */
enum class EventType {
    BLOCK_MINED,    ///< Блок добыт и добавлен в цепь
    MINING_FAILED,  ///< Попытка майнинга не удалась
    TX_ACCEPTED,    ///< Транзакция принята в pending пул
    TX_REJECTED,    ///< Транзакция отклонена
    CHAIN_VALID,    ///< Валидация цепи прошла
    CHAIN_INVALID,  ///< Валидация цепи нашла нарушения
    ERROR           ///< Ошибка
};

/**
 * @brief Преобразование типа события в строку
 */
[[nodiscard]] constexpr std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::BLOCK_MINED:   return "BLOCK_MINED";
        case EventType::MINING_FAILED: return "MINING_FAILED";
        case EventType::TX_ACCEPTED:   return "TX_ACCEPTED";
        case EventType::TX_REJECTED:   return "TX_REJECTED";
        case EventType::CHAIN_VALID:   return "CHAIN_VALID";
        case EventType::CHAIN_INVALID: return "CHAIN_INVALID";
        case EventType::ERROR:         return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Уровень, на котором событие попадает в историю
 */
[[nodiscard]] constexpr Level severity(EventType type) noexcept {
    switch (type) {
        case EventType::ERROR:
        case EventType::CHAIN_INVALID:
            return Level::Error;
        case EventType::MINING_FAILED:
        case EventType::TX_REJECTED:
            return Level::Warn;
        default:
            return Level::Info;
    }
}

/**
 * @brief Запись события
 */
struct EventRecord {
    EventType type;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::string miner;  ///< Для событий, связанных с майнером
};

// =============================================================================
// Провайдеры данных
// =============================================================================

/**
 * @brief Сводка состояния цепи
 */
struct ChainStatus {
    uint32_t height = 0;           ///< Количество блоков, включая genesis
    uint64_t total_games = 0;
    Amount total_supply = 0;
    uint32_t next_block = 1;
    uint32_t next_low_players = 0;
    uint32_t next_high_players = 0;
    uint64_t next_min_games = 0;
};

// =============================================================================
// Status Reporter
// =============================================================================

/**
 * @brief Репортёр статуса
 *
 * Все методы потокобезопасны.
 */
class StatusReporter {
public:
    /**
     * @brief Создать репортёр с конфигурацией
     */
    explicit StatusReporter(const LoggingConfig& config);

    ~StatusReporter();

    // Запрещаем копирование
    StatusReporter(const StatusReporter&) = delete;
    StatusReporter& operator=(const StatusReporter&) = delete;

    // ==========================================================================
    // Обновление данных
    // ==========================================================================

    void update_chain_status(const ChainStatus& status);

    /**
     * @brief Обновить счётчик добытых блоков майнера
     */
    void update_block_count(const std::string& miner, uint64_t count);

    // ==========================================================================
    // События
    // ==========================================================================

    /**
     * @brief Записать событие
     *
     * Событие с уровнем ниже настроенного отбрасывается.
     */
    void log_event(EventType type, const std::string& message,
                   const std::string& miner = "");

    void log_block_mined(uint32_t index, const std::string& miner,
                         uint64_t games, Amount reward);

    void log_mining_failed(const std::string& miner, uint64_t nonce,
                           const std::string& reason);

    void log_tx_accepted(const std::string& sender, const std::string& receiver,
                         Amount amount);

    void log_tx_rejected(const std::string& reason);

    /**
     * @brief Записать результат валидации цепи
     */
    void log_validation(bool valid, std::size_t blocks, std::size_t issues);

    /**
     * @brief Записать ошибку
     */
    void log_error(const std::string& message);

    /**
     * @brief Снимок истории событий (старые первыми)
     */
    [[nodiscard]] std::vector<EventRecord> events() const;

    // ==========================================================================
    // Рендеринг
    // ==========================================================================

    /**
     * @brief Получить текущий вывод статуса (без ANSI кодов)
     *
     * Используется для тестирования.
     */
    [[nodiscard]] std::string render_plain() const;

    /**
     * @brief Получить текущий вывод статуса (с ANSI кодами)
     */
    [[nodiscard]] std::string render() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Форматировать сумму в минимальных единицах как PhlopCoin
 *
 * 9900990099 -> "0.009900990099"
 */
[[nodiscard]] std::string format_amount(Amount units);

} // namespace phlop::log
