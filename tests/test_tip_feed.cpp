/**
 * @file test_tip_feed.cpp
 * @brief Тесты потока перцентилей tip и адаптивного tip
 */

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "monitoring/metrics.hpp"
#include "tips/tip_feed.hpp"

#include <thread>

namespace bundleminer::tests {

// =============================================================================
// adaptive_tip
// =============================================================================

/**
 * @brief Тест: cap == 0 выключает адаптивный tip
 */
TEST(AdaptiveTipTest, DisabledUsesBase) {
    tips::TipSnapshot snapshot;
    snapshot.p50 = 90'000;

    EXPECT_EQ(tips::adaptive_tip(1000, 0, snapshot, 30'000), 1000u);
}

/**
 * @brief Тест: поток не прогрет (p50 == 0)
 */
TEST(AdaptiveTipTest, ColdFeedUsesBase) {
    EXPECT_EQ(tips::adaptive_tip(1000, 40'000, tips::TipSnapshot{}, 30'000), 1000u);
}

/**
 * @brief Тест: ставка не ниже порога
 */
TEST(AdaptiveTipTest, FloorApplies) {
    tips::TipSnapshot snapshot;
    snapshot.p50 = 20'000;

    EXPECT_EQ(tips::adaptive_tip(1000, 40'000, snapshot, 30'000), 30'000u);
}

/**
 * @brief Тест: ставка p50 + 1 между порогом и потолком
 */
TEST(AdaptiveTipTest, BidsAboveMedian) {
    tips::TipSnapshot snapshot;
    snapshot.p50 = 35'000;

    EXPECT_EQ(tips::adaptive_tip(1000, 40'000, snapshot, 30'000), 35'001u);
}

/**
 * @brief Тест: ставка ограничена потолком
 */
TEST(AdaptiveTipTest, CapApplies) {
    tips::TipSnapshot snapshot;
    snapshot.p50 = 500'000;

    EXPECT_EQ(tips::adaptive_tip(1000, 40'000, snapshot, 30'000), 40'000u);
}

// =============================================================================
// parse_tip_message
// =============================================================================

/**
 * @brief Тест: перцентили переводятся из SOL в lamports
 */
TEST(TipMessageTest, ParsesFirstRecord) {
    const std::string message = R"([{
        "time": "2024-05-01T00:00:00Z",
        "landed_tips_25th_percentile": 0.00001,
        "landed_tips_50th_percentile": 0.00002,
        "landed_tips_75th_percentile": 0.0001,
        "landed_tips_95th_percentile": 0.001,
        "landed_tips_99th_percentile": 0.01,
        "ema_landed_tips_50th_percentile": 0.00002
    }])";

    auto parsed = tips::parse_tip_message(message);

    ASSERT_TRUE(parsed.has_value());
    ASSERT_TRUE(parsed->has_value());
    EXPECT_EQ((*parsed)->p25, 10'000u);
    EXPECT_EQ((*parsed)->p50, 20'000u);
    EXPECT_EQ((*parsed)->p75, 100'000u);
    EXPECT_EQ((*parsed)->p95, 1'000'000u);
    EXPECT_EQ((*parsed)->p99, 10'000'000u);
}

/**
 * @brief Тест: пустой массив - нет снимка
 */
TEST(TipMessageTest, EmptyArray) {
    auto parsed = tips::parse_tip_message("[]");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->has_value());
}

/**
 * @brief Тест: некорректное сообщение
 */
TEST(TipMessageTest, RejectsNonArray) {
    EXPECT_FALSE(tips::parse_tip_message("not json").has_value());
    EXPECT_FALSE(tips::parse_tip_message(R"({"landed_tips_50th_percentile": 1})").has_value());
}

// =============================================================================
// TipFeed
// =============================================================================

class TipFeedTest : public ::testing::Test {
protected:
    void SetUp() override {
        monitoring::Metrics::instance().reset();
    }

    void TearDown() override {
        monitoring::Metrics::instance().reset();
    }
};

/**
 * @brief Тест: до первого сообщения снимок нулевой
 */
TEST_F(TipFeedTest, StartsCold) {
    tips::TipFeed feed(std::make_unique<FakeTipStream>(std::vector<std::string>{}),
                       std::chrono::milliseconds(10));

    EXPECT_EQ(feed.snapshot().p50, 0u);
}

/**
 * @brief Тест: сообщение заменяет снимок целиком
 */
TEST_F(TipFeedTest, HandleMessagePublishes) {
    tips::TipFeed feed(std::make_unique<FakeTipStream>(std::vector<std::string>{}),
                       std::chrono::milliseconds(10));

    feed.handle_message(R"([{"landed_tips_25th_percentile": 0.00001, "landed_tips_50th_percentile": 0.00003}])");
    EXPECT_EQ(feed.snapshot().p25, 10'000u);
    EXPECT_EQ(feed.snapshot().p50, 30'000u);
    EXPECT_EQ(monitoring::Metrics::instance().get_tip_p50(), 30'000u);

    // Некорректное сообщение не портит снимок
    feed.handle_message("garbage");
    EXPECT_EQ(feed.snapshot().p50, 30'000u);
}

/**
 * @brief Тест: после разрыва поток переподключается
 */
TEST_F(TipFeedTest, ReconnectsAfterDisconnect) {
    auto stream = std::make_unique<FakeTipStream>(std::vector<std::string>{
        R"([{"landed_tips_50th_percentile": 0.00005}])"
    });
    stream->fail = true;
    auto* raw = stream.get();

    tips::TipFeed feed(std::move(stream), std::chrono::milliseconds(5));
    feed.start();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (feed.connection_attempts() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    feed.stop();

    EXPECT_GE(feed.connection_attempts(), 3u);
    EXPECT_GE(raw->runs.load(), 3u);
    EXPECT_EQ(feed.snapshot().p50, 50'000u);
}

/**
 * @brief Тест: параллельное чтение во время публикации
 */
TEST_F(TipFeedTest, ConcurrentReaders) {
    tips::TipFeed feed(std::make_unique<FakeTipStream>(std::vector<std::string>{}),
                       std::chrono::milliseconds(10));

    std::atomic<bool> consistent{true};
    {
        std::jthread writer([&feed] {
            for (uint64_t i = 1; i <= 1000; ++i) {
                tips::TipSnapshot snapshot{i, i, i, i, i};
                feed.publish(snapshot);
            }
        });
        std::jthread reader([&feed, &consistent] {
            for (int i = 0; i < 1000; ++i) {
                const auto snapshot = feed.snapshot();
                if (snapshot.p25 != snapshot.p99) {
                    consistent = false;
                }
            }
        });
    }

    EXPECT_TRUE(consistent.load());
    EXPECT_EQ(feed.snapshot().p50, 1000u);
}

} // namespace bundleminer::tests
