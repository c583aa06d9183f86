/**
 * @file logger.cpp
 * @brief Реализация диагностического лога
 */

#include "logger.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace phlop::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_write_mutex;

} // namespace

std::optional<Level> level_from_string(std::string_view str) noexcept {
    if (str == "error") return Level::Error;
    if (str == "warn") return Level::Warn;
    if (str == "info") return Level::Info;
    if (str == "debug") return Level::Debug;
    return std::nullopt;
}

void set_level(Level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(log::level());
}

void write(Level level, std::string_view component, std::string_view message) {
    if (!enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << "[" << component << "] " << message << std::endl;
}

} // namespace phlop::log
