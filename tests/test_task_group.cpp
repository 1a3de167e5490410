/**
 * @file test_task_group.cpp
 * @brief Тесты группы фоновых задач
 */

#include <gtest/gtest.h>

#include "core/task_group.hpp"

#include <atomic>
#include <chrono>

namespace bundleminer::tests {

using namespace std::chrono_literals;

/**
 * @brief Тест: sleep_for без остановки
 */
TEST(SleepForTest, CompletesWithoutStop) {
    EXPECT_TRUE(sleep_for(std::stop_token{}, 1ms));
}

/**
 * @brief Тест: остановка прерывает ожидание
 */
TEST(SleepForTest, InterruptedByStop) {
    std::stop_source stop;
    std::jthread stopper([&] {
        std::this_thread::sleep_for(5ms);
        stop.request_stop();
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(sleep_for(stop.get_token(), 10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

/**
 * @brief Тест: wait дожидается всех задач
 */
TEST(TaskGroupTest, WaitRunsAllTasks) {
    std::atomic<int> done{0};
    TaskGroup tasks;

    for (int i = 0; i < 8; ++i) {
        tasks.spawn([&done](std::stop_token) { ++done; });
    }
    tasks.wait();

    EXPECT_EQ(done.load(), 8);
    EXPECT_EQ(tasks.active(), 0u);
}

/**
 * @brief Тест: вложенная задача учитывается в wait
 */
TEST(TaskGroupTest, NestedSpawn) {
    std::atomic<int> done{0};
    TaskGroup tasks;

    tasks.spawn([&](std::stop_token) {
        tasks.spawn([&done](std::stop_token) { ++done; });
        ++done;
    });
    tasks.wait();

    EXPECT_EQ(done.load(), 2);
}

/**
 * @brief Тест: stop прерывает долгие задачи
 */
TEST(TaskGroupTest, StopInterruptsTasks) {
    std::atomic<int> interrupted{0};
    TaskGroup tasks;

    for (int i = 0; i < 3; ++i) {
        tasks.spawn([&interrupted](std::stop_token stop) {
            if (!sleep_for(stop, 30s)) {
                ++interrupted;
            }
        });
    }
    EXPECT_EQ(tasks.active(), 3u);

    tasks.stop();

    EXPECT_EQ(interrupted.load(), 3);
}

/**
 * @brief Тест: остановка родителя останавливает группу
 */
TEST(TaskGroupTest, ParentStopPropagates) {
    std::stop_source parent;
    std::atomic<bool> interrupted{false};
    TaskGroup tasks(parent.get_token());

    tasks.spawn([&interrupted](std::stop_token stop) {
        interrupted = !sleep_for(stop, 30s);
    });
    parent.request_stop();
    tasks.wait();

    EXPECT_TRUE(interrupted.load());
}

/**
 * @brief Тест: reap освобождает завершённые задачи
 */
TEST(TaskGroupTest, ReapFinished) {
    TaskGroup tasks;
    tasks.spawn([](std::stop_token) {});

    while (tasks.active() != 0) {
        std::this_thread::sleep_for(1ms);
    }
    tasks.reap();

    EXPECT_EQ(tasks.active(), 0u);
}

} // namespace bundleminer::tests
