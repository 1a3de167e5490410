/**
 * @file test_pooled_scheduler.cpp
 * @brief Тесты режима пула пакетов
 */

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "core/task_group.hpp"
#include "mining/pooled_scheduler.hpp"
#include "monitoring/metrics.hpp"

#include <chrono>
#include <mutex>
#include <thread>

namespace bundleminer::tests {

class PooledSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        monitoring::Metrics::instance().reset();

        config_.tip = 20'000;
        config_.max_buses = 1;
        config_.max_drain = 4;
        config_.batch_size = 5;
        config_.poll_interval_ms = 1;
        config_.error_backoff_ms = 1;
        config_.idle_wait_ms = 1;
        config_.slot_expiration = 20;

        pool_ = std::move(*mining::ResourcePool::create(test_identities(15), 5));
    }

    void TearDown() override {
        monitoring::Metrics::instance().reset();
    }

    FakeLedger ledger_;
    FakeRelay relay_;
    FakeSolver solver_;
    tips::TipFeed tips_{std::make_unique<FakeTipStream>(std::vector<std::string>{}),
                        std::chrono::milliseconds(10)};
    MiningConfig config_;
    mining::MiningContext context_{ledger_, relay_, solver_, tips_, test_addresses(),
                                   test_recipients(), config_};
    std::unique_ptr<mining::ResourcePool> pool_;
};

/**
 * @brief Тест: все пакеты отправлены, подтверждены и возвращены в пул
 */
TEST_F(PooledSchedulerTest, GroupLandsAndRecycles) {
    TaskGroup tasks;
    mining::PooledScheduler scheduler(context_, *pool_, tasks);

    EXPECT_EQ(scheduler.run_once(std::stop_token{}), 3u);
    tasks.wait();

    auto& metrics = monitoring::Metrics::instance();
    EXPECT_EQ(relay_.sent(), 3u);
    EXPECT_EQ(metrics.get_bundles_landed(), 3u);
    EXPECT_EQ(metrics.get_rewards_total(), 3u * 5'000u);
    EXPECT_EQ(pool_->idle_batches(), 3u);
    EXPECT_EQ(metrics.get_idle_identities(), 15);
    EXPECT_EQ(solver_.calls.load(), 1u);
}

/**
 * @brief Тест: неподтверждённые пакеты тоже возвращаются
 */
TEST_F(PooledSchedulerTest, DroppedBatchesRecycle) {
    ledger_.land_all = false;
    TaskGroup tasks;
    mining::PooledScheduler scheduler(context_, *pool_, tasks);

    EXPECT_EQ(scheduler.run_once(std::stop_token{}), 3u);
    tasks.wait();

    EXPECT_EQ(monitoring::Metrics::instance().get_bundles_dropped(), 3u);
    EXPECT_EQ(pool_->idle_batches(), 3u);
}

/**
 * @brief Тест: отклонённые relay пакеты возвращаются сразу
 */
TEST_F(PooledSchedulerTest, RejectedBatchesRecycle) {
    relay_.reject = true;
    TaskGroup tasks;
    mining::PooledScheduler scheduler(context_, *pool_, tasks);

    EXPECT_EQ(scheduler.run_once(std::stop_token{}), 3u);
    tasks.wait();

    EXPECT_EQ(monitoring::Metrics::instance().get_relay_rejections(), 3u);
    EXPECT_EQ(ledger_.status_calls, 0u);
    EXPECT_EQ(pool_->idle_batches(), 3u);
}

/**
 * @brief Тест: пакет с отсутствующим балансом пропускается без падения
 */
TEST_F(PooledSchedulerTest, MissingBalanceSkipsBatch) {
    ledger_.missing_balances.insert(pool_->batch(1).pubkeys[0].bytes);
    TaskGroup tasks;
    mining::PooledScheduler scheduler(context_, *pool_, tasks);

    EXPECT_EQ(scheduler.run_once(std::stop_token{}), 3u);
    tasks.wait();

    EXPECT_EQ(relay_.sent(), 2u);
    EXPECT_EQ(pool_->idle_batches(), 3u);
}

/**
 * @brief Тест: пул ограничивает количество пакетов за раз
 */
TEST_F(PooledSchedulerTest, DrainIsBoundedByConfig) {
    config_.max_drain = 2;
    TaskGroup tasks;
    mining::PooledScheduler scheduler(context_, *pool_, tasks);

    EXPECT_EQ(scheduler.run_once(std::stop_token{}), 2u);
    EXPECT_EQ(scheduler.run_once(std::stop_token{}), 1u);
    tasks.wait();

    EXPECT_EQ(relay_.sent(), 3u);
    EXPECT_EQ(pool_->idle_batches(), 3u);
}

/**
 * @brief Тест: при остановке взятые пакеты возвращаются
 */
TEST_F(PooledSchedulerTest, StopReleasesDrained) {
    ledger_.snapshot_error = true;
    TaskGroup tasks;
    mining::PooledScheduler scheduler(context_, *pool_, tasks);
    std::stop_source stop;

    std::jthread stopper([&](std::stop_token own) {
        while (ledger_.snapshot_calls < 3 && !own.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        stop.request_stop();
    });

    EXPECT_EQ(scheduler.run_once(stop.get_token()), 3u);
    tasks.wait();

    EXPECT_EQ(relay_.sent(), 0u);
    EXPECT_EQ(pool_->idle_batches(), 3u);
}

/**
 * @brief Тест: ошибка получения состояния повторяется с теми же пакетами
 */
TEST_F(PooledSchedulerTest, SnapshotErrorRetriesWithoutRelease) {
    ledger_.snapshot_error = true;
    TaskGroup tasks;
    mining::PooledScheduler scheduler(context_, *pool_, tasks);

    std::jthread recover([&](std::stop_token own) {
        while (ledger_.snapshot_calls < 3 && !own.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        // Пакеты всё ещё у планировщика
        EXPECT_EQ(pool_->idle_batches(), 0u);
        EXPECT_EQ(solver_.calls.load(), 0u);
        std::lock_guard<std::mutex> lock(ledger_.mutex);
        ledger_.snapshot_error = false;
    });

    EXPECT_EQ(scheduler.run_once(std::stop_token{}), 3u);
    tasks.wait();

    EXPECT_GE(monitoring::Metrics::instance().get_rpc_errors(), 3u);
    EXPECT_EQ(solver_.calls.load(), 1u);
    EXPECT_EQ(relay_.sent(), 3u);
    EXPECT_EQ(pool_->idle_batches(), 3u);
}

/**
 * @brief Тест: решение дольше остатка эпохи отбрасывается, пакеты не возвращаются
 */
TEST_F(PooledSchedulerTest, SolveExceedingEpochIsNotSubmitted) {
    ledger_.snapshot.clock.unix_timestamp = ledger_.snapshot.treasury.last_reset_at + 59;
    solver_.slow_calls = 1;
    solver_.delay = std::chrono::milliseconds(1'100);
    TaskGroup tasks;
    mining::PooledScheduler scheduler(context_, *pool_, tasks);

    std::jthread observer([&](std::stop_token own) {
        while (solver_.calls < 1 && !own.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        EXPECT_EQ(pool_->idle_batches(), 0u);
    });

    EXPECT_EQ(scheduler.run_once(std::stop_token{}), 3u);
    tasks.wait();

    // Первое решение отброшено, отправлено только второе
    EXPECT_EQ(solver_.calls.load(), 2u);
    EXPECT_EQ(relay_.sent(), 3u);
    EXPECT_EQ(ledger_.blockhash_calls, 1u);
    EXPECT_EQ(pool_->idle_batches(), 3u);
}

/**
 * @brief Тест: просроченная эпоха - опрос с паузой, решатель не запускается
 */
TEST_F(PooledSchedulerTest, OverdueEpochWaitsWithoutSolving) {
    config_.error_backoff_ms = 20;
    ledger_.snapshot.clock.unix_timestamp = ledger_.snapshot.treasury.last_reset_at + 61;
    TaskGroup tasks;
    mining::PooledScheduler scheduler(context_, *pool_, tasks);

    const auto start = std::chrono::steady_clock::now();
    std::jthread reset([&](std::stop_token own) {
        while (ledger_.snapshot_calls < 3 && !own.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));
        EXPECT_EQ(solver_.calls.load(), 0u);
        EXPECT_EQ(pool_->idle_batches(), 0u);
        std::lock_guard<std::mutex> lock(ledger_.mutex);
        ledger_.snapshot.treasury.last_reset_at = ledger_.snapshot.clock.unix_timestamp;
    });

    EXPECT_EQ(scheduler.run_once(std::stop_token{}), 3u);
    tasks.wait();

    EXPECT_EQ(solver_.calls.load(), 1u);
    EXPECT_EQ(relay_.sent(), 3u);
    EXPECT_EQ(pool_->idle_batches(), 3u);
}

/**
 * @brief Тест: полный цикл планировщика много раз подряд сохраняет пул
 */
TEST_F(PooledSchedulerTest, RunConservesPool) {
    config_.max_drain = 1;
    std::stop_source stop;
    {
        TaskGroup tasks(stop.get_token());
        mining::PooledScheduler scheduler(context_, *pool_, tasks);
        std::jthread thread([&scheduler, token = stop.get_token()] { scheduler.run(token); });

        while (relay_.sent() < 12) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        stop.request_stop();
        thread.join();
        tasks.stop();
    }

    EXPECT_EQ(pool_->idle_batches(), 3u);
    EXPECT_EQ(monitoring::Metrics::instance().get_idle_identities(), 15);
}

} // namespace bundleminer::tests
