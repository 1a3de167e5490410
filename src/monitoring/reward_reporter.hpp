/**
 * @file reward_reporter.hpp
 * @brief Периодический отчёт о добытых наградах
 *
 * Раз в интервал забирает счётчик наград (обнуляя его), пишет сумму в
 * лог, если она ненулевая, и выводит сводку метрик.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <thread>

namespace bundleminer::monitoring {

/**
 * @brief Фоновый репортёр наград
 */
class RewardReporter {
public:
    explicit RewardReporter(std::chrono::seconds interval);
    ~RewardReporter();

    // Запрещаем копирование
    RewardReporter(const RewardReporter&) = delete;
    RewardReporter& operator=(const RewardReporter&) = delete;

    /// @brief Запустить фоновый поток
    void start();

    /// @brief Остановить поток
    void stop();

    /**
     * @brief Выполнить один отчёт
     *
     * @return Награда с момента предыдущего отчёта
     */
    uint64_t report_once();

private:
    void run(std::stop_token stop);

    std::chrono::seconds interval_;
    std::jthread thread_;
};

} // namespace bundleminer::monitoring
