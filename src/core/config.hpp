/**
 * @file config.hpp
 * @brief Конфигурация PhlopChain
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 *
 * Пример конфигурации (phlopchain.toml):
 * @code
 * [mining]
 * max_rounds = 10000
 * max_attempts = 16
 *
 * [chain]
 * max_transactions_per_block = 100
 * verify_mining_on_validate = true
 *
 * [genesis]
 * timestamp = 1700000000
 * [[genesis.accounts]]
 * name = "genesis"
 * balance = 1000000
 *
 * [logging]
 * level = "info"
 * event_history = 200
 * color = true
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace phlop {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки майнинга
 */
struct MiningConfig {
    /// @brief Лимит раундов одной попытки (MiningFailed при превышении)
    uint32_t max_rounds = constants::DEFAULT_MAX_ROUNDS;

    /// @brief Сколько nonce перебирает mine_pending
    uint32_t max_attempts = constants::DEFAULT_MAX_ATTEMPTS;
};

/**
 * @brief Настройки цепи
 */
struct ChainConfig {
    /// @brief Максимум pending транзакций в блоке (без mint)
    std::size_t max_transactions_per_block = constants::DEFAULT_MAX_TXS_PER_BLOCK;

    /// @brief Переигрывать доказательства майнинга при валидации
    bool verify_mining_on_validate = true;
};

/**
 * @brief Начальный счёт genesis блока
 */
struct GenesisAccountConfig {
    std::string name;

    /// @brief Баланс в целых PhlopCoin
    uint64_t balance = 0;

    /**
     * @brief Баланс в минимальных единицах
     */
    [[nodiscard]] Amount balance_units() const noexcept {
        return balance * constants::UNITS_PER_PHLOP;
    }
};

/**
 * @brief Настройки genesis блока
 */
struct GenesisConfig {
    /// @brief Временная метка genesis блока
    int64_t timestamp = constants::DEFAULT_GENESIS_TIMESTAMP;

    /// @brief Начальное распределение монет
    std::vector<GenesisAccountConfig> accounts = {
        {"genesis", 1'000'000},
        {"alice", 1'000},
        {"bob", 500},
    };
};

/**
 * @brief Настройки логирования и терминального вывода
 */
struct LoggingConfig {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";

    /// @brief Размер истории событий
    std::size_t event_history = constants::DEFAULT_EVENT_HISTORY;

    /// @brief Включить ANSI цвета в терминале
    bool color = true;
};

/**
 * @brief Полная конфигурация PhlopChain
 */
struct Config {
    MiningConfig mining;
    ChainConfig chain;
    GenesisConfig genesis;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из строки TOML
     */
    [[nodiscard]] static Result<Config> parse(std::string_view content);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./phlopchain.toml
     * 3. /etc/phlopchain/phlopchain.toml
     * 4. ~/.config/phlopchain/phlopchain.toml
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет диапазоны числовых значений, уровень логирования
     * и счета genesis (непустые, уникальные, не coinbase, баланс > 0).
     *
     * @return Result<void> Успех или ошибка валидации
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace phlop
