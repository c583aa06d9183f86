/**
 * @file main.cpp
 * @brief Точка входа демонстрационного узла PhlopChain
 *
 * PhlopChain - учебный блокчейн с консенсусом "камень-ножницы-бумага".
 *
 * Основные компоненты:
 * 1. Config - загрузка phlopchain.toml
 * 2. Node - цепь, ledger и pending пул под одной блокировкой
 * 3. MiningEngine - детерминированные игры против 100 игроков
 * 4. ChainValidator - проверка цепи и доказательства включения
 * 5. StatusReporter - события и сводка состояния
 *
 * Использование:
 *   phlopchain [options]
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   -m, --miner NAME     Имя майнера
 *   -b, --blocks N       Сколько блоков добыть
 *   --validate-only      Только проверить цепь genesis и выйти
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/byte_order.hpp"
#include "core/primitives/transaction.hpp"
#include "log/logger.hpp"
#include "log/status_reporter.hpp"
#include "monitoring/stats.hpp"
#include "node/node.hpp"

#include <charconv>
#include <format>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
PhlopChain v)" << VERSION << R"(
Учебный блокчейн с майнингом "камень-ножницы-бумага"

ИСПОЛЬЗОВАНИЕ:
    phlopchain [ОПЦИИ]

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (phlopchain.toml)
    -m, --miner NAME     Имя майнера (по умолчанию "miner")
    -b, --blocks N       Сколько блоков добыть (по умолчанию 3)
    --validate-only      Проверить цепь и выйти без майнинга
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы

ПРИМЕРЫ:
    phlopchain -m alice -b 5
    phlopchain -c /etc/phlopchain/phlopchain.toml --validate-only

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "PhlopChain v" << VERSION << std::endl;
}

/**
 * @brief Вывести баннер при запуске
 */
void print_banner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════════╗
║                                                                   ║
║   ██████╗ ██╗  ██╗██╗      ██████╗ ██████╗                        ║
║   ██╔══██╗██║  ██║██║     ██╔═══██╗██╔══██╗                       ║
║   ██████╔╝███████║██║     ██║   ██║██████╔╝                       ║
║   ██╔═══╝ ██╔══██║██║     ██║   ██║██╔═══╝                        ║
║   ██║     ██║  ██║███████╗╚██████╔╝██║                            ║
║   ╚═╝     ╚═╝  ╚═╝╚══════╝ ╚═════╝ ╚═╝     CHAIN                  ║
║                                                                   ║
║              Rock / Paper / Scissors consensus                    ║
║                        v)" << VERSION << R"(                                  ║
║                                                                   ║
╚═══════════════════════════════════════════════════════════════════╝
)";
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    std::string miner = "miner";
    uint32_t blocks = 3;
    bool validate_only = false;
    bool show_help = false;
    bool show_version = false;
    bool bad_args = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--validate-only") {
            args.validate_only = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-m" || arg == "--miner") && i + 1 < argc) {
            args.miner = argv[++i];
        } else if ((arg == "-b" || arg == "--blocks") && i + 1 < argc) {
            std::string_view value = argv[++i];
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), args.blocks);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                std::cerr << "[ERROR] Некорректное число блоков: " << value << std::endl;
                args.bad_args = true;
            }
        } else {
            std::cerr << "[ERROR] Неизвестный аргумент: " << arg << std::endl;
            args.bad_args = true;
        }
    }

    return args;
}

/**
 * @brief Загрузить конфигурацию; без файла используются значения по умолчанию
 */
phlop::Result<phlop::Config> load_config(const Args& args) {
    using namespace phlop;

    if (args.config_path) {
        return Config::load(*args.config_path);
    }

    auto config = Config::load_with_search();
    if (!config && config.error().code == ErrorCode::ConfigNotFound) {
        std::cout << "[INFO] Файл конфигурации не найден, используются значения по умолчанию"
                  << std::endl;
        return Config{};
    }
    return config;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace phlop;

    auto args = parse_args(argc, argv);

    if (args.bad_args) {
        print_help();
        return 2;
    }

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    print_banner();

    // Загружаем конфигурацию
    auto config_result = load_config(args);
    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return 1;
    }

    Config config = *config_result;

    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return 1;
    }

    if (auto level = log::level_from_string(config.logging.level)) {
        log::set_level(*level);
    }

    std::optional<node::Node> phlop_node;
    try {
        phlop_node.emplace(config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] Не удалось создать genesis блок: " << e.what() << std::endl;
        return 1;
    }

    auto& node = *phlop_node;

    if (!args.validate_only) {
        // Пример перевода между genesis счетами
        if (config.genesis.accounts.size() >= 2) {
            const auto& from = config.genesis.accounts[0].name;
            const auto& to = config.genesis.accounts[1].name;

            core::Transaction tx;
            tx.sender = from;
            tx.receiver = to;
            tx.amount = 10 * constants::UNITS_PER_PHLOP;
            tx.nonce = node.get_nonce(from) + 1;

            auto submitted = node.submit_transaction(tx);
            if (submitted) {
                std::cout << "[INFO] Транзакция " << from << " -> " << to
                          << " принята: " << to_hex(*submitted) << std::endl;
            } else {
                std::cerr << "[WARNING] Транзакция отклонена: "
                          << submitted.error().message << std::endl;
            }
        }

        std::cout << "[INFO] Майнер '" << args.miner << "' добывает "
                  << args.blocks << " блок(ов)..." << std::endl;

        for (uint32_t i = 0; i < args.blocks; ++i) {
            auto block = node.mine_pending(args.miner);
            if (!block) {
                std::cerr << "[ERROR] " << block.error().message << std::endl;
                break;
            }
            std::cout << std::format("[INFO] Блок #{}: {} игр за {} раундов, награда {} PHLOP",
                                     block->index, block->mining.games_played,
                                     block->mining.rounds,
                                     log::format_amount(block->mining.reward))
                      << std::endl;
        }
    }

    auto report = node.validate_chain();

    std::cout << node.reporter().render();

    std::cout << "\n=== Балансы ===" << std::endl;
    for (const auto& [account, balance] : node.get_accounts()) {
        std::cout << std::format("{:<16} {} PHLOP", account, log::format_amount(balance))
                  << std::endl;
    }

    std::cout << "\n" << monitoring::format_chain_stats(node.stats());
    std::cout << "\n" << report.summary() << std::endl;

    return report.valid() ? 0 : 1;
}
