/**
 * @file task_group.hpp
 * @brief Фоновые задачи и прерываемые паузы
 *
 * TaskGroup владеет потоками fire-and-forget задач (отправка bundle,
 * наблюдение за подтверждением). Завершённые потоки освобождаются при
 * следующем spawn или reap; при остановке группа запрашивает stop у всех
 * задач и дожидается их.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace bundleminer {

/**
 * @brief Пауза, прерываемая запросом остановки
 *
 * @return true если пауза прошла полностью, false если запрошена остановка
 */
bool sleep_for(std::stop_token stop, std::chrono::milliseconds duration);

/**
 * @brief Группа фоновых задач
 */
class TaskGroup {
public:
    using Task = std::function<void(std::stop_token)>;

    /**
     * @param parent Токен внешней остановки (остановка родителя
     *               останавливает все задачи группы)
     */
    explicit TaskGroup(std::stop_token parent = {});
    ~TaskGroup();

    // Запрещаем копирование
    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    /// @brief Запустить задачу в отдельном потоке
    void spawn(Task task);

    /// @brief Освободить потоки завершённых задач
    void reap();

    /// @brief Количество незавершённых задач
    [[nodiscard]] std::size_t active() const;

    /// @brief Дождаться завершения всех задач
    void wait();

    /// @brief Запросить остановку и дождаться завершения
    void stop();

private:
    struct Entry {
        std::jthread thread;
        std::atomic<bool> done{false};
    };

    void reap_locked();

    std::stop_source stop_source_;
    std::stop_callback<std::function<void()>> parent_callback_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::list<std::unique_ptr<Entry>> entries_;
    std::size_t running_ = 0;
};

} // namespace bundleminer
