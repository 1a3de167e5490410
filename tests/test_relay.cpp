/**
 * @file test_relay.cpp
 * @brief Тесты отправки bundle в relay
 *
 * Проверяет ограничения на размер bundle и обработку
 * недоступного relay без реальной сети.
 */

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "relay/bundle_relay.hpp"

#include <vector>

namespace bundleminer::tests {

namespace {

ledger::Transaction make_transaction(uint8_t tag) {
    const auto payer = test_keypair(tag);
    std::vector<ledger::Instruction> ixs = {
        test_addresses().transfer(payer.pubkey(), test_recipients().pick(), 1'000),
    };
    const std::vector<const crypto::Keypair*> signers = {&payer};
    return *ledger::Transaction::build(ixs, payer.pubkey(), signers, Hash256{});
}

/// @brief Relay на закрытом порту
RelayConfig unreachable_relay() {
    RelayConfig config;
    config.url = "http://127.0.0.1:1/api/v1/bundles";
    config.timeout_seconds = 2;
    return config;
}

} // namespace

/**
 * @brief Тест: пустой bundle
 */
TEST(JitoRelayTest, RejectsEmptyBundle) {
    relay::JitoRelay relay(unreachable_relay());

    auto result = relay.send_bundle({});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RelayRejected);
}

/**
 * @brief Тест: больше пяти транзакций
 */
TEST(JitoRelayTest, RejectsOversizedBundle) {
    relay::JitoRelay relay(unreachable_relay());
    std::vector<ledger::Transaction> transactions;
    for (uint8_t i = 0; i <= constants::MAX_TRANSACTIONS_PER_BUNDLE; ++i) {
        transactions.push_back(make_transaction(static_cast<uint8_t>(i + 1)));
    }

    auto result = relay.send_bundle(transactions);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RelayRejected);
}

/**
 * @brief Тест: недоступный relay - отказ, а не исключение
 */
TEST(JitoRelayTest, UnreachableRelayIsRejection) {
    relay::JitoRelay relay(unreachable_relay());
    const std::vector<ledger::Transaction> transactions = {make_transaction(1)};

    auto result = relay.send_bundle(transactions);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RelayRejected);
}

} // namespace bundleminer::tests
