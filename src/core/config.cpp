/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <limits>
#include <set>

namespace phlop {

namespace {

/**
 * @brief Прочитать неотрицательное целое с проверкой диапазона типа
 */
template<typename T>
Result<void> read_unsigned(
    const toml::table& table,
    std::string_view section,
    std::string_view key,
    T& out
) {
    if (auto val = table[key].value<int64_t>()) {
        if (*val < 0 ||
            static_cast<uint64_t>(*val) > std::numeric_limits<T>::max()) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("{}.{}: значение {} вне диапазона", section, key, *val)
            );
        }
        out = static_cast<T>(*val);
    }
    return {};
}

Result<Config> from_table(const toml::table& table) {
    Config config;

    // === Секция [mining] ===
    if (auto mining = table["mining"].as_table()) {
        if (auto r = read_unsigned(*mining, "mining", "max_rounds", config.mining.max_rounds); !r) {
            return std::unexpected(r.error());
        }
        if (auto r = read_unsigned(*mining, "mining", "max_attempts", config.mining.max_attempts); !r) {
            return std::unexpected(r.error());
        }
    }

    // === Секция [chain] ===
    if (auto chain = table["chain"].as_table()) {
        if (auto r = read_unsigned(*chain, "chain", "max_transactions_per_block",
                                   config.chain.max_transactions_per_block); !r) {
            return std::unexpected(r.error());
        }
        if (auto val = (*chain)["verify_mining_on_validate"].value<bool>()) {
            config.chain.verify_mining_on_validate = *val;
        }
    }

    // === Секция [genesis] ===
    if (auto genesis = table["genesis"].as_table()) {
        if (auto val = (*genesis)["timestamp"].value<int64_t>()) {
            config.genesis.timestamp = *val;
        }

        // Парсим счета из [[genesis.accounts]]
        if (auto accounts = (*genesis)["accounts"].as_array()) {
            config.genesis.accounts.clear();
            for (const auto& account_node : *accounts) {
                auto account_table = account_node.as_table();
                if (!account_table) {
                    return Err<Config>(
                        ErrorCode::ConfigInvalidValue,
                        "genesis.accounts: элемент должен быть таблицей"
                    );
                }

                GenesisAccountConfig account;
                if (auto name = (*account_table)["name"].value<std::string>()) {
                    account.name = *name;
                }
                if (auto r = read_unsigned(*account_table, "genesis.accounts", "balance",
                                           account.balance); !r) {
                    return std::unexpected(r.error());
                }
                config.genesis.accounts.push_back(std::move(account));
            }
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto r = read_unsigned(*logging, "logging", "event_history",
                                   config.logging.event_history); !r) {
            return std::unexpected(r.error());
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
    }

    return config;
}

} // namespace

// =============================================================================
// Config - Загрузка
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML ({}): {}", path.string(), e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view content) {
    try {
        auto table = toml::parse(content);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный путь обязан существовать
    if (path.has_value()) {
        return load(path.value());
    }

    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("phlopchain.toml");
    search_paths.push_back("/etc/phlopchain/phlopchain.toml");

    // Домашняя директория пользователя
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "phlopchain" / "phlopchain.toml"
        );
    }

    // Ищем первый существующий файл
    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (mining.max_rounds < 1) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "mining.max_rounds должен быть >= 1");
    }
    if (mining.max_attempts < 1) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "mining.max_attempts должен быть >= 1");
    }

    if (chain.max_transactions_per_block < 1 ||
        chain.max_transactions_per_block > constants::MAX_TXS_PER_BLOCK_LIMIT) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("chain.max_transactions_per_block должен быть от 1 до {}",
                        constants::MAX_TXS_PER_BLOCK_LIMIT)
        );
    }

    // Баланс в единицах не должен переполнять Amount
    constexpr uint64_t max_balance = std::numeric_limits<Amount>::max() / constants::UNITS_PER_PHLOP;

    std::set<std::string, std::less<>> names;
    Amount total_supply = 0;
    for (const auto& account : genesis.accounts) {
        if (account.name.empty()) {
            return Err<void>(ErrorCode::ConfigInvalidValue, "Пустое имя счёта в genesis.accounts");
        }
        if (account.name == constants::COINBASE_SENDER) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("Имя '{}' зарезервировано", constants::COINBASE_SENDER)
            );
        }
        if (!names.insert(account.name).second) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("Счёт '{}' указан в genesis дважды", account.name)
            );
        }
        if (account.balance == 0 || account.balance > max_balance) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("Баланс счёта '{}' должен быть от 1 до {}", account.name, max_balance)
            );
        }

        // Сумма всех mint genesis тоже должна помещаться в Amount
        Amount units = account.balance_units();
        if (units > std::numeric_limits<Amount>::max() - total_supply) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("Суммарный баланс genesis переполняет Amount на счёте '{}'",
                            account.name)
            );
        }
        total_supply += units;
    }

    if (logging.level != "error" && logging.level != "warn" &&
        logging.level != "info" && logging.level != "debug") {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "logging.level должен быть 'error', 'warn', 'info' или 'debug'"
        );
    }
    if (logging.event_history < 1) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "logging.event_history должен быть >= 1");
    }

    return {};
}

} // namespace phlop
