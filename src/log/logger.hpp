/**
 * @file logger.hpp
 * @brief Диагностические строки в stderr с фильтром по уровню
 *
 * Формат строки: "[Component] сообщение". Уровень задаётся
 * logging.level из конфигурации.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace phlop::log {

/**
 * @brief Уровень логирования
 */
enum class Level : uint8_t {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Error: return "error";
        case Level::Warn:  return "warn";
        case Level::Info:  return "info";
        case Level::Debug: return "debug";
        default: return "unknown";
    }
}

/**
 * @brief Разобрать уровень из строки конфигурации
 */
[[nodiscard]] std::optional<Level> level_from_string(std::string_view str) noexcept;

/**
 * @brief Установить глобальный уровень (по умолчанию Info)
 */
void set_level(Level level) noexcept;

[[nodiscard]] Level level() noexcept;

[[nodiscard]] bool enabled(Level level) noexcept;

/**
 * @brief Записать строку "[component] message", если уровень включён
 *
 * Потокобезопасно: строки разных потоков не перемешиваются.
 */
void write(Level level, std::string_view component, std::string_view message);

inline void error(std::string_view component, std::string_view message) {
    write(Level::Error, component, message);
}

inline void warn(std::string_view component, std::string_view message) {
    write(Level::Warn, component, message);
}

inline void info(std::string_view component, std::string_view message) {
    write(Level::Info, component, message);
}

inline void debug(std::string_view component, std::string_view message) {
    write(Level::Debug, component, message);
}

} // namespace phlop::log
