/**
 * @file test_claim_runner.cpp
 * @brief Тесты вывода наград
 */

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "ledger/accounts.hpp"
#include "mining/claim_runner.hpp"
#include "monitoring/metrics.hpp"

#include <thread>

namespace bundleminer::tests {

// =============================================================================
// plan_claim_units
// =============================================================================

/**
 * @brief Тест: нулевые награды пропускаются, остальные по убыванию
 */
TEST(ClaimPlanTest, SortsAndSkipsEmpty) {
    const auto identities = test_identities(4);
    std::vector<ledger::Proof> proofs(4);
    proofs[0].claimable_rewards = 10;
    proofs[1].claimable_rewards = 0;
    proofs[2].claimable_rewards = 30;
    proofs[3].claimable_rewards = 20;

    auto units = mining::plan_claim_units(identities, proofs);

    ASSERT_EQ(units.size(), 1u);
    ASSERT_EQ(units[0].transactions.size(), 1u);
    const auto& entries = units[0].transactions[0];
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].identity, &identities[2]);
    EXPECT_EQ(entries[1].identity, &identities[3]);
    EXPECT_EQ(entries[2].identity, &identities[0]);
    EXPECT_EQ(units[0].total, 60u);
    EXPECT_EQ(units[0].accounts, 3u);
}

/**
 * @brief Тест: 5 ключей на транзакцию, 5 транзакций на единицу
 */
TEST(ClaimPlanTest, ChunksIntoUnits) {
    const auto identities = test_identities(27);
    std::vector<ledger::Proof> proofs(27);
    for (auto& proof : proofs) {
        proof.claimable_rewards = 100;
    }

    auto units = mining::plan_claim_units(identities, proofs);

    ASSERT_EQ(units.size(), 2u);
    EXPECT_EQ(units[0].transactions.size(), 5u);
    EXPECT_EQ(units[0].accounts, 25u);
    EXPECT_EQ(units[1].transactions.size(), 1u);
    EXPECT_EQ(units[1].accounts, 2u);
    EXPECT_EQ(units[1].total, 200u);
}

// =============================================================================
// ClaimRunner
// =============================================================================

class ClaimRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        monitoring::Metrics::instance().reset();

        mining_.tip = 10'000;
        mining_.poll_interval_ms = 1;
        mining_.error_backoff_ms = 1;
        mining_.slot_expiration = 20;

        identities_ = test_identities(12);
        for (std::size_t i = 0; i < identities_.size(); ++i) {
            ledger_.claimable[identities_[i].proof] = 1'000 * (i + 1);
        }
        beneficiary_tokens_ = test_keypair(200).pubkey();
    }

    void TearDown() override {
        monitoring::Metrics::instance().reset();
    }

    FakeLedger ledger_;
    FakeRelay relay_;
    MiningConfig mining_;
    ClaimConfig claim_;
    std::vector<mining::Identity> identities_;
    ledger::Pubkey beneficiary_tokens_;
    mining::ClaimRunner runner_{ledger_, relay_, test_addresses(), test_recipients(), mining_, claim_};
};

/**
 * @brief Тест: подтверждённый claim выводит всё
 */
TEST_F(ClaimRunnerTest, ClaimsEverything) {
    auto summary = runner_.run_once(std::stop_token{}, identities_, beneficiary_tokens_);

    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary->total_claimable, 78'000u);
    EXPECT_EQ(summary->claimed, 78'000u);
    EXPECT_EQ(summary->remaining, 0u);
    EXPECT_EQ(summary->units_landed, 1u);

    ASSERT_EQ(relay_.sent(), 1u);
    // 12 ключей - 3 транзакции в одном bundle
    EXPECT_EQ(relay_.bundles[0].size(), 3u);
    for (const auto& tx : relay_.bundles[0]) {
        EXPECT_TRUE(tx.verify());
    }
}

/**
 * @brief Тест: tip только в первой транзакции единицы
 */
TEST_F(ClaimRunnerTest, BribeInFirstTransactionOnly) {
    auto summary = runner_.run_once(std::stop_token{}, identities_, beneficiary_tokens_);
    ASSERT_TRUE(summary.has_value());
    ASSERT_EQ(relay_.sent(), 1u);

    const auto& system_program = test_addresses().well_known.system_program;
    std::vector<std::size_t> transfers;
    for (const auto& tx : relay_.bundles[0]) {
        std::size_t count = 0;
        for (const auto& ix : tx.message().instructions) {
            if (tx.message().account_keys[ix.program_id_index] == system_program) {
                ++count;
            }
        }
        transfers.push_back(count);
    }
    EXPECT_EQ(transfers, (std::vector<std::size_t>{1, 0, 0}));
}

/**
 * @brief Тест: отклонённая симуляцией единица не отправляется и списывается один раз
 */
TEST_F(ClaimRunnerTest, SimulationRejectionIsIdempotent) {
    ledger_.simulation_error = "custom program error: 0x1";

    auto first = runner_.run_once(std::stop_token{}, identities_, beneficiary_tokens_);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(relay_.sent(), 0u);
    EXPECT_EQ(first->rejected, 78'000u);
    EXPECT_EQ(first->remaining, 0u);
    EXPECT_EQ(first->units_rejected, 1u);

    auto second = runner_.run_once(std::stop_token{}, identities_, beneficiary_tokens_);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(relay_.sent(), 0u);
    EXPECT_EQ(second->rejected, first->rejected);
    EXPECT_EQ(second->remaining, first->remaining);
    EXPECT_EQ(monitoring::Metrics::instance().get_simulation_rejections(), 2u);
}

/**
 * @brief Тест: единица меньше порога не выводится
 */
TEST_F(ClaimRunnerTest, ThresholdStopsClaim) {
    claim_.threshold = ledger::amount_to_ui(1'000'000);

    auto summary = runner_.run_once(std::stop_token{}, identities_, beneficiary_tokens_);

    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(relay_.sent(), 0u);
    EXPECT_EQ(ledger_.simulate_calls, 0u);
    EXPECT_EQ(summary->claimed, 0u);
    EXPECT_EQ(summary->remaining, 78'000u);
}

/**
 * @brief Тест: неподтверждённый bundle отправляется заново с новым blockhash
 */
TEST_F(ClaimRunnerTest, DroppedBundleIsResent) {
    ledger_.land_all = false;
    ledger_.slot_step = 100;

    std::stop_source stop;
    std::jthread stopper([&](std::stop_token own) {
        while (relay_.sent() < 2 && !own.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        stop.request_stop();
    });

    auto summary = runner_.run_once(stop.get_token(), identities_, beneficiary_tokens_);

    ASSERT_TRUE(summary.has_value());
    EXPECT_GE(relay_.sent(), 2u);
    EXPECT_GE(summary->units_dropped, 1u);
    EXPECT_EQ(summary->claimed, 0u);
    // Повтор подписан с другим blockhash
    EXPECT_NE(relay_.bundles[0][0].id(), relay_.bundles[1][0].id());
}

/**
 * @brief Тест: получатель должен иметь token аккаунт
 */
TEST_F(ClaimRunnerTest, BeneficiaryMustExist) {
    claim_.beneficiary = test_keypair(201).pubkey().to_base58();

    auto missing = runner_.resolve_beneficiary();
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::RpcAccountNotFound);

    auto tokens = test_addresses().token_account(test_keypair(201).pubkey());
    ASSERT_TRUE(tokens.has_value());
    ledger_.existing.insert(tokens->bytes);

    auto resolved = runner_.resolve_beneficiary();
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, *tokens);
}

/**
 * @brief Тест: некорректный адрес получателя
 */
TEST_F(ClaimRunnerTest, InvalidBeneficiary) {
    claim_.beneficiary = "not-a-key";

    auto resolved = runner_.resolve_beneficiary();

    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, ErrorCode::ConfigInvalidValue);
}

// =============================================================================
// Создание token аккаунта
// =============================================================================

/**
 * @brief Тест: существующий аккаунт не пересоздаётся
 */
TEST_F(ClaimRunnerTest, InitTokenAccountSkipsExisting) {
    const auto owner = test_keypair(210);
    auto tokens = test_addresses().token_account(owner.pubkey());
    ASSERT_TRUE(tokens.has_value());
    ledger_.existing.insert(tokens->bytes);

    auto created = runner_.init_token_account(std::stop_token{}, owner);

    ASSERT_TRUE(created.has_value()) << created.error().message;
    EXPECT_EQ(*created, *tokens);
    EXPECT_TRUE(ledger_.sent_transactions.empty());
}

/**
 * @brief Тест: владелец создаёт и оплачивает свой token аккаунт
 */
TEST_F(ClaimRunnerTest, InitTokenAccountCreates) {
    const auto owner = test_keypair(211);

    auto created = runner_.init_token_account(std::stop_token{}, owner);

    ASSERT_TRUE(created.has_value()) << created.error().message;
    ASSERT_EQ(ledger_.sent_transactions.size(), 1u);
    const auto& tx = ledger_.sent_transactions[0];
    EXPECT_TRUE(tx.verify());
    EXPECT_EQ(tx.message().account_keys[0], owner.pubkey());
    ASSERT_EQ(tx.message().instructions.size(), 1u);
    const auto& ix = tx.message().instructions[0];
    EXPECT_EQ(tx.message().account_keys[ix.program_id_index],
              test_addresses().well_known.associated_token_program);
    EXPECT_EQ(*created, *test_addresses().token_account(owner.pubkey()));
    EXPECT_EQ(relay_.sent(), 0u);
}

/**
 * @brief Тест: ошибка preflight возвращается вызывающему
 */
TEST_F(ClaimRunnerTest, InitTokenAccountSendError) {
    ledger_.send_error = true;

    auto created = runner_.init_token_account(std::stop_token{}, test_keypair(212));

    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, ErrorCode::RpcInternalError);
}

/**
 * @brief Тест: неподтверждённая транзакция создания - ошибка
 */
TEST_F(ClaimRunnerTest, InitTokenAccountNotLanded) {
    ledger_.land_all = false;

    auto created = runner_.init_token_account(std::stop_token{}, test_keypair(213));

    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, ErrorCode::NetworkTimeout);
}

} // namespace bundleminer::tests
