/**
 * @file status_reporter.cpp
 * @brief Реализация репортёра статуса
 */

#include "status_reporter.hpp"

#include <chrono>
#include <ctime>
#include <deque>
#include <format>
#include <iomanip>
#include <map>
#include <mutex>
#include <sstream>

namespace phlop::log {

// =============================================================================
// ANSI коды цветов
// =============================================================================

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";

    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

std::string format_amount(Amount units) {
    return std::format("{}.{:012}", units / constants::UNITS_PER_PHLOP,
                       units % constants::UNITS_PER_PHLOP);
}

// =============================================================================
// Реализация
// =============================================================================

struct StatusReporter::Impl {
    LoggingConfig config;
    Level min_level;
    std::chrono::steady_clock::time_point start_time;

    // Данные
    ChainStatus chain_status;
    std::map<std::string, uint64_t> block_counts;
    mutable std::mutex data_mutex;

    // События
    std::deque<EventRecord> events;
    mutable std::mutex events_mutex;

    explicit Impl(const LoggingConfig& cfg)
        : config(cfg)
        , min_level(level_from_string(cfg.level).value_or(Level::Info))
        , start_time(std::chrono::steady_clock::now()) {}

    std::string render_impl(bool use_color) const {
        std::ostringstream out;

        const char* bold = use_color ? ansi::BOLD : "";
        const char* reset = use_color ? ansi::RESET : "";
        const char* green = use_color ? ansi::GREEN : "";
        const char* yellow = use_color ? ansi::YELLOW : "";
        const char* red = use_color ? ansi::RED : "";
        const char* cyan = use_color ? ansi::CYAN : "";
        const char* dim = use_color ? ansi::DIM : "";

        // === Заголовок ===
        out << bold << "═══════════════════════════════════════════════════════════════════\n"
            << "                         PHLOPCHAIN NODE\n"
            << "═══════════════════════════════════════════════════════════════════" << reset << "\n\n";

        // === Uptime ===
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time);
        out << bold << "Uptime: " << reset
            << std::setfill('0') << std::setw(2) << uptime.count() / 3600 << ":"
            << std::setw(2) << (uptime.count() % 3600) / 60 << ":"
            << std::setw(2) << uptime.count() % 60 << std::setfill(' ') << "\n\n";

        {
            std::lock_guard<std::mutex> lock(data_mutex);

            // === Chain ===
            out << bold << "Chain:" << reset << "\n";
            out << "  Height: " << chain_status.height << " blocks\n";
            out << "  Games played: " << chain_status.total_games << "\n";
            out << "  Supply: " << format_amount(chain_status.total_supply) << " PHLOP\n\n";

            // === Next difficulty ===
            out << bold << "Next block #" << chain_status.next_block << ":" << reset << "\n";
            out << "  Quota: " << chain_status.next_low_players << " x 1 win, "
                << chain_status.next_high_players << " x 2 wins\n";
            out << "  Min games: " << chain_status.next_min_games << "\n\n";

            // === Miners ===
            out << bold << "Miners:" << reset << "\n";
            if (block_counts.empty()) {
                out << "  " << dim << "(none)" << reset << "\n";
            } else {
                for (const auto& [miner, count] : block_counts) {
                    out << "  • " << miner << " (" << cyan << count << " blocks" << reset << ")\n";
                }
            }
            out << "\n";
        }

        // === Recent Events ===
        out << bold << "Recent Events:" << reset << "\n";
        {
            std::lock_guard<std::mutex> events_lock(events_mutex);
            if (events.empty()) {
                out << "  " << dim << "(no events)" << reset << "\n";
            } else {
                // Показываем последние 10 событий
                std::size_t start = events.size() > 10 ? events.size() - 10 : 0;
                for (std::size_t i = start; i < events.size(); ++i) {
                    const auto& event = events[i];

                    auto time = std::chrono::system_clock::to_time_t(event.timestamp);
                    std::tm tm{};
                    localtime_r(&time, &tm);
                    out << "  " << std::put_time(&tm, "%H:%M:%S") << " ";

                    switch (event.type) {
                        case EventType::BLOCK_MINED:
                            out << bold << green << "[" << to_string(event.type) << "]" << reset;
                            break;
                        case EventType::TX_ACCEPTED:
                        case EventType::CHAIN_VALID:
                            out << green << "[" << to_string(event.type) << "]" << reset;
                            break;
                        case EventType::MINING_FAILED:
                        case EventType::TX_REJECTED:
                            out << yellow << "[" << to_string(event.type) << "]" << reset;
                            break;
                        case EventType::CHAIN_INVALID:
                        case EventType::ERROR:
                            out << red << "[" << to_string(event.type) << "]" << reset;
                            break;
                    }

                    out << " " << event.message;
                    if (!event.miner.empty()) {
                        out << dim << " (" << event.miner << ")" << reset;
                    }
                    out << "\n";
                }
            }
        }

        out << "\n" << bold << "───────────────────────────────────────────────────────────────────" << reset << "\n";

        return out.str();
    }
};

// =============================================================================
// Публичный API
// =============================================================================

StatusReporter::StatusReporter(const LoggingConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

StatusReporter::~StatusReporter() = default;

void StatusReporter::update_chain_status(const ChainStatus& status) {
    std::lock_guard<std::mutex> lock(impl_->data_mutex);
    impl_->chain_status = status;
}

void StatusReporter::update_block_count(const std::string& miner, uint64_t count) {
    std::lock_guard<std::mutex> lock(impl_->data_mutex);
    impl_->block_counts[miner] = count;
}

void StatusReporter::log_event(EventType type, const std::string& message,
                               const std::string& miner) {
    if (static_cast<uint8_t>(severity(type)) > static_cast<uint8_t>(impl_->min_level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(impl_->events_mutex);

    EventRecord record;
    record.type = type;
    record.timestamp = std::chrono::system_clock::now();
    record.message = message;
    record.miner = miner;

    impl_->events.push_back(std::move(record));

    // Ограничиваем размер истории
    while (impl_->events.size() > impl_->config.event_history) {
        impl_->events.pop_front();
    }
}

void StatusReporter::log_block_mined(uint32_t index, const std::string& miner,
                                     uint64_t games, Amount reward) {
    log_event(EventType::BLOCK_MINED,
              std::format("Block #{} mined in {} games, reward {} PHLOP",
                          index, games, format_amount(reward)),
              miner);
}

void StatusReporter::log_mining_failed(const std::string& miner, uint64_t nonce,
                                       const std::string& reason) {
    log_event(EventType::MINING_FAILED,
              std::format("Attempt nonce {} failed: {}", nonce, reason),
              miner);
}

void StatusReporter::log_tx_accepted(const std::string& sender, const std::string& receiver,
                                     Amount amount) {
    log_event(EventType::TX_ACCEPTED,
              std::format("{} -> {}: {} PHLOP", sender, receiver, format_amount(amount)));
}

void StatusReporter::log_tx_rejected(const std::string& reason) {
    log_event(EventType::TX_REJECTED, reason);
}

void StatusReporter::log_validation(bool valid, std::size_t blocks, std::size_t issues) {
    if (valid) {
        log_event(EventType::CHAIN_VALID, std::format("{} blocks verified", blocks));
    } else {
        log_event(EventType::CHAIN_INVALID,
                  std::format("{} issues in {} blocks", issues, blocks));
    }
}

void StatusReporter::log_error(const std::string& message) {
    log_event(EventType::ERROR, message);
}

std::vector<EventRecord> StatusReporter::events() const {
    std::lock_guard<std::mutex> lock(impl_->events_mutex);
    return {impl_->events.begin(), impl_->events.end()};
}

std::string StatusReporter::render_plain() const {
    return impl_->render_impl(false);
}

std::string StatusReporter::render() const {
    return impl_->render_impl(impl_->config.color);
}

} // namespace phlop::log
