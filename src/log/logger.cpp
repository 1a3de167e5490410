/**
 * @file logger.cpp
 * @brief Реализация консольного логгера
 */

#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace bundleminer::log {

std::optional<Level> parse_level(std::string_view name) noexcept {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warning;
    if (name == "error") return Level::Error;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::write(Level level, std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(level, message);
        return;
    }
    write_console(level, message);
}

void Logger::write_console(Level level, std::string_view message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream ss;
    ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ";
    ss << "[" << to_string(level) << "] ";
    ss << message;

    auto& out = (level == Level::Error) ? std::cerr : std::cout;

    if (!color_.load(std::memory_order_relaxed)) {
        out << ss.str() << std::endl;
        return;
    }

    switch (level) {
        case Level::Debug:
            out << "\033[90m" << ss.str() << "\033[0m" << std::endl;
            break;
        case Level::Info:
            out << "\033[32m" << ss.str() << "\033[0m" << std::endl;
            break;
        case Level::Warning:
            out << "\033[33m" << ss.str() << "\033[0m" << std::endl;
            break;
        case Level::Error:
            out << "\033[31m" << ss.str() << "\033[0m" << std::endl;
            break;
    }
}

} // namespace bundleminer::log
