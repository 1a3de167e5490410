/**
 * @file logger.hpp
 * @brief Консольный логгер bundleminer
 *
 * Формат строки: `[YYYY-MM-DD HH:MM:SS] [LEVEL] сообщение`.
 * Контекст событий пишется парами `key=value` после сообщения.
 *
 * @code
 * log::info("bundle отправлен id={} tip={}", bundle_id, tip);
 * @endcode
 */

#pragma once

#include <atomic>
#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace bundleminer::log {

/**
 * @brief Уровень логирования
 */
enum class Level {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

/**
 * @brief Преобразование уровня в строку
 */
[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Debug:   return "DEBUG";
        case Level::Info:    return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error:   return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Разобрать уровень из строки конфигурации
 *
 * @return Уровень или std::nullopt для неизвестной строки
 */
[[nodiscard]] std::optional<Level> parse_level(std::string_view name) noexcept;

/**
 * @brief Глобальный логгер (singleton)
 *
 * Потокобезопасен: строки от разных потоков не перемешиваются.
 */
class Logger {
public:
    /// @brief Callback, получающий каждую записанную строку
    using Sink = std::function<void(Level, std::string_view)>;

    [[nodiscard]] static Logger& instance();

    void set_level(Level level) noexcept { level_.store(level, std::memory_order_relaxed); }
    [[nodiscard]] Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    void set_color(bool enabled) noexcept { color_.store(enabled, std::memory_order_relaxed); }

    /**
     * @brief Перенаправить вывод
     *
     * Пустой sink возвращает вывод в консоль.
     */
    void set_sink(Sink sink);

    [[nodiscard]] bool enabled(Level level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(this->level());
    }

    /// @brief Записать строку (без проверки уровня)
    void write(Level level, std::string_view message);

    // Запрещаем копирование
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    void write_console(Level level, std::string_view message);

    std::atomic<Level> level_{Level::Info};
    std::atomic<bool> color_{true};
    std::mutex mutex_;
    Sink sink_;
};

// =============================================================================
// Функции форматированного вывода
// =============================================================================

template<typename... Args>
void write(Level level, std::format_string<Args...> fmt, Args&&... args) {
    auto& logger = Logger::instance();
    if (!logger.enabled(level)) {
        return;
    }
    logger.write(level, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    write(Level::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    write(Level::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    write(Level::Warning, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    write(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace bundleminer::log
