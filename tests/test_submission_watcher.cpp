/**
 * @file test_submission_watcher.cpp
 * @brief Тесты отслеживания подтверждения bundle
 */

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "mining/submission_watcher.hpp"
#include "monitoring/metrics.hpp"

namespace bundleminer::tests {

namespace {

ledger::Signature make_signature(uint8_t tag) {
    ledger::Signature signature;
    signature.bytes.fill(tag);
    return signature;
}

} // namespace

class SubmissionWatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        monitoring::Metrics::instance().reset();
        record_.signatures = {make_signature(1), make_signature(2)};
        record_.sent_at_slot = ledger_.slot;
        record_.reward_estimate = 25'000;
        record_.tip_paid = 30'000;
    }

    void TearDown() override {
        monitoring::Metrics::instance().reset();
    }

    FakeLedger ledger_;
    mining::SubmissionRecord record_;
    mining::SubmissionWatcher watcher_{ledger_, std::chrono::milliseconds(1), 150};
};

/**
 * @brief Тест: подтверждение на первом опросе
 */
TEST_F(SubmissionWatcherTest, LandsImmediately) {
    ledger_.land_all = true;

    auto result = watcher_.watch(std::stop_token{}, record_);

    EXPECT_EQ(result.outcome, mining::Outcome::Landed);
    EXPECT_EQ(result.polls, 1u);
    ASSERT_TRUE(result.landed_signature.has_value());
    EXPECT_EQ(*result.landed_signature, record_.signatures[0]);
}

/**
 * @brief Тест: подтверждена любая из подписей
 */
TEST_F(SubmissionWatcherTest, AnySignatureLands) {
    ledger_.land_all = false;
    ledger_.landed.insert(record_.signatures[1].bytes);

    auto result = watcher_.watch(std::stop_token{}, record_);

    EXPECT_EQ(result.outcome, mining::Outcome::Landed);
    ASSERT_TRUE(result.landed_signature.has_value());
    EXPECT_EQ(*result.landed_signature, record_.signatures[1]);
}

/**
 * @brief Тест: без подтверждения наблюдение завершается в окне слотов
 */
TEST_F(SubmissionWatcherTest, NeverLandsTerminates) {
    ledger_.land_all = false;
    ledger_.slot_step = 10;

    auto result = watcher_.watch(std::stop_token{}, record_);

    EXPECT_EQ(result.outcome, mining::Outcome::Dropped);
    EXPECT_GE(result.last_slot, record_.sent_at_slot + 150);
    EXPECT_EQ(result.polls, 15u);
}

/**
 * @brief Тест: ошибка со статусом подписи не считается подтверждением
 */
TEST_F(SubmissionWatcherTest, FailedTransactionIsNotLanded) {
    rpc::SignatureStatus status;
    status.confirmation = rpc::Confirmation::Finalized;
    status.error = "InstructionError";
    EXPECT_FALSE(status.landed());

    status.error.reset();
    EXPECT_TRUE(status.landed());

    status.confirmation = rpc::Confirmation::Processed;
    EXPECT_FALSE(status.landed());
}

/**
 * @brief Тест: остановка прерывает ожидание
 */
TEST_F(SubmissionWatcherTest, StopEndsWatch) {
    ledger_.land_all = false;
    std::stop_source stop;
    stop.request_stop();

    auto result = watcher_.watch(stop.get_token(), record_);

    EXPECT_EQ(result.outcome, mining::Outcome::Dropped);
    EXPECT_EQ(result.polls, 0u);
}

/**
 * @brief Тест: учёт результата в метриках
 */
TEST_F(SubmissionWatcherTest, RecordOutcomeUpdatesMetrics) {
    auto& metrics = monitoring::Metrics::instance();

    mining::WatchResult landed;
    landed.outcome = mining::Outcome::Landed;
    landed.landed_signature = record_.signatures[0];
    mining::record_outcome("batch=0", record_, landed, tips::TipSnapshot{});

    mining::WatchResult dropped;
    dropped.outcome = mining::Outcome::Dropped;
    mining::record_outcome("batch=1", record_, dropped, tips::TipSnapshot{});

    EXPECT_EQ(metrics.get_bundles_landed(), 1u);
    EXPECT_EQ(metrics.get_bundles_dropped(), 1u);
    EXPECT_EQ(metrics.get_rewards_total(), 25'000u);
    EXPECT_EQ(metrics.get_confirmation_count(), 1u);
}

} // namespace bundleminer::tests
