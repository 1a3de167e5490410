/**
 * @file test_accounts.cpp
 * @brief Тесты декодирования аккаунтов программы майнинга
 */

#include <gtest/gtest.h>

#include "core/byte_order.hpp"
#include "core/constants.hpp"
#include "ledger/accounts.hpp"

namespace bundleminer::tests {

namespace {

Bytes discriminator() {
    return Bytes(constants::ACCOUNT_DISCRIMINATOR_SIZE, 0x64);
}

} // namespace

/**
 * @brief Тест: Treasury
 */
TEST(AccountsTest, DecodeTreasury) {
    Bytes data = discriminator();
    append_le<uint64_t>(data, 255);
    data.insert(data.end(), 32, 0x11);
    data.insert(data.end(), 32, 0x22);
    append_le<uint64_t>(data, 1'700'000'000);
    append_le<uint64_t>(data, 4'200);
    append_le<uint64_t>(data, 99);

    auto treasury = ledger::decode_treasury(data);

    ASSERT_TRUE(treasury.has_value()) << treasury.error().message;
    EXPECT_EQ(treasury->bump, 255u);
    EXPECT_EQ(treasury->admin.bytes[0], 0x11);
    EXPECT_EQ(treasury->difficulty[31], 0x22);
    EXPECT_EQ(treasury->last_reset_at, 1'700'000'000);
    EXPECT_EQ(treasury->reward_rate, 4'200u);
    EXPECT_EQ(treasury->total_claimed_rewards, 99u);
}

/**
 * @brief Тест: Bus
 */
TEST(AccountsTest, DecodeBus) {
    Bytes data = discriminator();
    append_le<uint64_t>(data, 7);
    append_le<uint64_t>(data, 123'456);

    auto bus = ledger::decode_bus(data);

    ASSERT_TRUE(bus.has_value());
    EXPECT_EQ(bus->id, 7u);
    EXPECT_EQ(bus->rewards, 123'456u);
}

/**
 * @brief Тест: Proof
 */
TEST(AccountsTest, DecodeProof) {
    Bytes data = discriminator();
    data.insert(data.end(), 32, 0x33);
    append_le<uint64_t>(data, 5'000);
    data.insert(data.end(), 32, 0x44);
    append_le<uint64_t>(data, 10);
    append_le<uint64_t>(data, 20);

    auto proof = ledger::decode_proof(data);

    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(proof->authority.bytes[5], 0x33);
    EXPECT_EQ(proof->claimable_rewards, 5'000u);
    EXPECT_EQ(proof->hash[0], 0x44);
    EXPECT_EQ(proof->total_hashes, 10u);
    EXPECT_EQ(proof->total_rewards, 20u);
}

/**
 * @brief Тест: Clock без дискриминатора
 */
TEST(AccountsTest, DecodeClock) {
    Bytes data;
    append_le<uint64_t>(data, 250'000'000);
    append_le<uint64_t>(data, 1'699'999'000);
    append_le<uint64_t>(data, 580);
    append_le<uint64_t>(data, 581);
    append_le<uint64_t>(data, 1'700'000'030);

    auto clock = ledger::decode_clock(data);

    ASSERT_TRUE(clock.has_value());
    EXPECT_EQ(clock->slot, 250'000'000u);
    EXPECT_EQ(clock->epoch, 580u);
    EXPECT_EQ(clock->unix_timestamp, 1'700'000'030);
}

/**
 * @brief Тест: короткие данные
 */
TEST(AccountsTest, ShortDataIsError) {
    const Bytes data(ledger::BUS_SIZE - 1, 0);

    auto bus = ledger::decode_bus(data);

    ASSERT_FALSE(bus.has_value());
    EXPECT_EQ(bus.error().code, ErrorCode::LedgerInvalidAccount);
    EXPECT_FALSE(ledger::decode_treasury(data).has_value());
    EXPECT_FALSE(ledger::decode_proof(data).has_value());
    EXPECT_FALSE(ledger::decode_clock(Bytes(ledger::CLOCK_SIZE - 1, 0)).has_value());
}

/**
 * @brief Тест: время до следующей эпохи
 */
TEST(AccountsTest, TimeToNextEpoch) {
    ledger::Treasury treasury;
    treasury.last_reset_at = 1'000;
    ledger::Clock clock;

    clock.unix_timestamp = 1'000;
    EXPECT_EQ(ledger::time_to_next_epoch(treasury, clock), std::chrono::seconds(60));

    clock.unix_timestamp = 1'045;
    EXPECT_EQ(ledger::time_to_next_epoch(treasury, clock), std::chrono::seconds(15));

    // Эпоха уже истекла, но сброс ещё не произошёл
    clock.unix_timestamp = 1'090;
    EXPECT_EQ(ledger::time_to_next_epoch(treasury, clock), std::chrono::seconds(0));
}

/**
 * @brief Тест: перевод в UI единицы и обратно
 */
TEST(AccountsTest, UiAmount) {
    EXPECT_DOUBLE_EQ(ledger::amount_to_ui(1'500'000'000), 1.5);
    EXPECT_DOUBLE_EQ(ledger::amount_to_ui(0), 0.0);

    EXPECT_EQ(ledger::ui_to_amount(0.25), 250'000'000u);
    EXPECT_EQ(ledger::ui_to_amount(0.000000001), 1u);
    EXPECT_EQ(ledger::ui_to_amount(-1.0), 0u);
}

} // namespace bundleminer::tests
