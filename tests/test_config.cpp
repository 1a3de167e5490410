/**
 * @file test_config.cpp
 * @brief Тесты загрузки и проверки конфигурации
 */

#include <gtest/gtest.h>

#include "core/config.hpp"

#include <filesystem>
#include <fstream>

namespace bundleminer::tests {

namespace {

constexpr std::string_view FULL_CONFIG = R"(
[rpc]
url = "http://127.0.0.1:8899"
timeout_seconds = 10

[relay]
url = "https://relay.example/api/v1/bundles"

[tip_feed]
url = "wss://relay.example/tip_stream"
reconnect_seconds = 2

[mining]
key_folder = "/var/lib/bundleminer/keys"
tip = 25000
max_adaptive_tip = 80000
adaptive_tip_floor = 20000
max_buses = 3
threads = 8
concurrency = 2
batch_size = 10
max_drain = 6
poll_interval_ms = 1500

[claim]
beneficiary = "11111111111111111111111111111111"
threshold = 0.5
auto = true

[logging]
level = "debug"
color = false
)";

} // namespace

/**
 * @brief Тест: значения по умолчанию
 */
TEST(ConfigTest, Defaults) {
    auto config = Config::parse("");

    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->rpc.url, constants::DEFAULT_RPC_URL);
    EXPECT_EQ(config->mining.tip, 0u);
    EXPECT_EQ(config->mining.batch_size, constants::DEFAULT_BATCH_SIZE);
    EXPECT_EQ(config->mining.adaptive_tip_floor, constants::DEFAULT_ADAPTIVE_TIP_FLOOR);
    EXPECT_EQ(config->program.program_id, constants::DEFAULT_PROGRAM_ID);
    EXPECT_FALSE(config->claim.auto_claim);
    EXPECT_TRUE(config->validate().has_value());
}

/**
 * @brief Тест: все секции
 */
TEST(ConfigTest, ParsesAllSections) {
    auto config = Config::parse(FULL_CONFIG);

    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->rpc.url, "http://127.0.0.1:8899");
    EXPECT_EQ(config->rpc.timeout_seconds, 10u);
    EXPECT_EQ(config->tip_feed.reconnect_seconds, 2u);
    EXPECT_EQ(config->mining.key_folder, "/var/lib/bundleminer/keys");
    EXPECT_EQ(config->mining.tip, 25'000u);
    EXPECT_EQ(config->mining.max_adaptive_tip, 80'000u);
    EXPECT_EQ(config->mining.adaptive_tip_floor, 20'000u);
    EXPECT_EQ(config->mining.max_buses, 3u);
    EXPECT_EQ(config->mining.threads, 8u);
    EXPECT_EQ(config->mining.concurrency, 2u);
    EXPECT_EQ(config->mining.batch_size, 10u);
    EXPECT_EQ(config->mining.max_drain, 6u);
    EXPECT_EQ(config->mining.poll_interval_ms, 1'500u);
    EXPECT_DOUBLE_EQ(config->claim.threshold, 0.5);
    EXPECT_TRUE(config->claim.auto_claim);
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_FALSE(config->logging.color);

    EXPECT_TRUE(config->validate().has_value());
    EXPECT_TRUE(config->validate_for_mining().has_value());
    EXPECT_TRUE(config->validate_for_claim().has_value());
}

/**
 * @brief Тест: синтаксическая ошибка TOML
 */
TEST(ConfigTest, ParseError) {
    auto config = Config::parse("[mining\ntip = ");

    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParseError);
}

/**
 * @brief Тест: отсутствующий файл
 */
TEST(ConfigTest, MissingFile) {
    auto config = Config::load("/nonexistent/bundleminer.toml");

    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigNotFound);
}

/**
 * @brief Тест: загрузка из файла
 */
TEST(ConfigTest, LoadFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "bundleminer_config_test.toml";
    {
        std::ofstream out(path);
        out << FULL_CONFIG;
    }

    auto config = Config::load_with_search(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->mining.tip, 25'000u);
}

/**
 * @brief Тест: границы размера пакета и количества bus
 */
TEST(ConfigTest, RejectsOutOfRangeLimits) {
    Config config;

    config.mining.batch_size = constants::MAX_IDENTITIES_PER_BUNDLE + 1;
    EXPECT_FALSE(config.validate().has_value());
    config.mining.batch_size = 0;
    EXPECT_FALSE(config.validate().has_value());
    config.mining.batch_size = constants::MAX_IDENTITIES_PER_BUNDLE;
    EXPECT_TRUE(config.validate().has_value());

    config.mining.max_buses = constants::BUS_COUNT + 1;
    EXPECT_FALSE(config.validate().has_value());
    config.mining.max_buses = 1;

    config.mining.concurrency = 0;
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalidValue);
}

/**
 * @brief Тест: схема URL потока tip
 */
TEST(ConfigTest, TipFeedMustBeWebSocket) {
    Config config;
    config.tip_feed.url = "https://relay.example/tip_stream";

    EXPECT_FALSE(config.validate().has_value());
}

/**
 * @brief Тест: неизвестный уровень логирования
 */
TEST(ConfigTest, RejectsUnknownLogLevel) {
    Config config;
    config.logging.level = "verbose";

    EXPECT_FALSE(config.validate().has_value());
}

/**
 * @brief Тест: майнинг без tip запрещён
 */
TEST(ConfigTest, MiningRequiresTip) {
    Config config;
    config.mining.key_folder = "/keys";

    auto result = config.validate_for_mining();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalidValue);

    config.mining.tip = 1;
    EXPECT_TRUE(config.validate_for_mining().has_value());

    config.mining.key_folder.clear();
    EXPECT_FALSE(config.validate_for_mining().has_value());
}

/**
 * @brief Тест: claim требует получателя и неотрицательный порог
 */
TEST(ConfigTest, ClaimRequiresBeneficiary) {
    Config config;
    config.mining.key_folder = "/keys";
    config.mining.tip = 10'000;

    EXPECT_FALSE(config.validate_for_claim().has_value());

    config.claim.beneficiary = "11111111111111111111111111111111";
    EXPECT_TRUE(config.validate_for_claim().has_value());

    config.claim.threshold = -1.0;
    EXPECT_FALSE(config.validate_for_claim().has_value());
}

} // namespace bundleminer::tests
