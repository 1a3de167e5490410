/**
 * @file test_bundle_builder.cpp
 * @brief Тесты сборки bundle
 */

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "mining/bundle_builder.hpp"

namespace bundleminer::tests {

namespace {

/// @brief Количество инструкций перевода tip в транзакции
std::size_t count_transfers(const ledger::Transaction& tx) {
    const auto& message = tx.message();
    const auto& system_program = test_addresses().well_known.system_program;
    std::size_t count = 0;
    for (const auto& ix : message.instructions) {
        if (message.account_keys[ix.program_id_index] == system_program) {
            ++count;
        }
    }
    return count;
}

std::vector<mining::SolveResult> fake_results(std::size_t count) {
    std::vector<mining::SolveResult> results(count);
    for (std::size_t i = 0; i < count; ++i) {
        results[i].hash.fill(static_cast<uint8_t>(i));
        results[i].nonce = 1000 + i;
    }
    return results;
}

} // namespace

class BundleBuilderTest : public ::testing::Test {
protected:
    rpc::BalanceMap balances_for(std::span<const mining::Identity> identities) {
        rpc::BalanceMap balances;
        uint64_t balance = 1'000'000;
        for (const auto& identity : identities) {
            balances[identity.pubkey()] = balance;
            balance += 1'000;
        }
        return balances;
    }

    mining::BundleBuilder builder_{test_addresses(), test_recipients()};
    Hash256 blockhash_{};
    ledger::Bus bus_{3, 1'000'000};
};

/**
 * @brief Тест: полный пакет - 5 транзакций, один tip
 */
TEST_F(BundleBuilderTest, FullBatchShape) {
    const auto identities = test_identities(25);
    const auto results = fake_results(25);

    auto bundle = builder_.build(identities, results, balances_for(identities), blockhash_, bus_, 20'000);

    ASSERT_TRUE(bundle.has_value()) << bundle.error().message;
    ASSERT_EQ(bundle->transactions.size(), 5u);
    ASSERT_EQ(bundle->fee_charges.size(), 5u);

    std::size_t transfers = 0;
    for (const auto& tx : bundle->transactions) {
        EXPECT_LE(tx.message().instructions.size(), 6u);
        EXPECT_EQ(tx.message().header.num_required_signatures, 5);
        EXPECT_TRUE(tx.verify());
        EXPECT_LE(tx.serialize().size(), constants::MAX_TRANSACTION_SIZE);
        transfers += count_transfers(tx);
    }
    EXPECT_EQ(transfers, 1u);
}

/**
 * @brief Тест: неполный пакет - ceil(N/5) транзакций
 */
TEST_F(BundleBuilderTest, PartialBatchShape) {
    const auto identities = test_identities(7);
    const auto results = fake_results(7);

    auto bundle = builder_.build(identities, results, balances_for(identities), blockhash_, bus_, 20'000);

    ASSERT_TRUE(bundle.has_value()) << bundle.error().message;
    ASSERT_EQ(bundle->transactions.size(), 2u);
    EXPECT_EQ(bundle->transactions[0].message().header.num_required_signatures, 5);
    EXPECT_EQ(bundle->transactions[1].message().header.num_required_signatures, 2);
}

/**
 * @brief Тест: tip платит самый богатый ключ пакета
 */
TEST_F(BundleBuilderTest, TipperIsRichest) {
    const auto identities = test_identities(10);
    const auto results = fake_results(10);
    auto balances = balances_for(identities);
    balances[identities[7].pubkey()] = 50'000'000;

    auto bundle = builder_.build(identities, results, balances, blockhash_, bus_, 20'000);

    ASSERT_TRUE(bundle.has_value());
    EXPECT_EQ(bundle->tipper, identities[7].pubkey());
    EXPECT_EQ(bundle->tip, 20'000u);

    // Перевод в транзакции, содержащей ключ tipper
    EXPECT_EQ(count_transfers(bundle->transactions[0]), 0u);
    EXPECT_EQ(count_transfers(bundle->transactions[1]), 1u);

    // Плательщик второй транзакции - тот же ключ, его расход включает tip
    EXPECT_EQ(bundle->fee_charges[1].payer, identities[7].pubkey());
    EXPECT_EQ(bundle->fee_charges[1].cost, constants::FEE_PER_SIGNER * 5 + 20'000);
    EXPECT_EQ(bundle->fee_charges[0].cost, constants::FEE_PER_SIGNER * 5);
}

/**
 * @brief Тест: плательщик транзакции - первый в списке аккаунтов
 */
TEST_F(BundleBuilderTest, FeePayerIsFirstAccount) {
    const auto identities = test_identities(5);
    const auto results = fake_results(5);
    auto balances = balances_for(identities);
    balances[identities[2].pubkey()] = 90'000'000;

    auto bundle = builder_.build(identities, results, balances, blockhash_, bus_, 1);

    ASSERT_TRUE(bundle.has_value());
    EXPECT_EQ(bundle->transactions[0].message().account_keys.front(), identities[2].pubkey());
    EXPECT_EQ(bundle->tracking_signature(), bundle->transactions[0].id());
}

/**
 * @brief Тест: отсутствующий баланс - ошибка, а не падение
 */
TEST_F(BundleBuilderTest, MissingBalanceIsRecoverable) {
    const auto identities = test_identities(5);
    const auto results = fake_results(5);
    auto balances = balances_for(identities);
    balances.erase(identities[4].pubkey());

    auto bundle = builder_.build(identities, results, balances, blockhash_, bus_, 1);

    ASSERT_FALSE(bundle.has_value());
    EXPECT_EQ(bundle.error().code, ErrorCode::FeePayerBalanceMissing);
}

/**
 * @brief Тест: некорректные входные данные
 */
TEST_F(BundleBuilderTest, RejectsInvalidBatch) {
    const auto identities = test_identities(26);
    const auto balances = balances_for(identities);

    auto too_many = builder_.build(identities, fake_results(26), balances, blockhash_, bus_, 1);
    ASSERT_FALSE(too_many.has_value());
    EXPECT_EQ(too_many.error().code, ErrorCode::MiningInvalidBatch);

    const auto five = std::span<const mining::Identity>(identities).first(5);
    auto mismatch = builder_.build(five, fake_results(4), balances, blockhash_, bus_, 1);
    ASSERT_FALSE(mismatch.has_value());
    EXPECT_EQ(mismatch.error().code, ErrorCode::MiningInvalidBatch);

    auto bad_bus = builder_.build(five, fake_results(5), balances, blockhash_, ledger::Bus{8, 0}, 1);
    ASSERT_FALSE(bad_bus.has_value());
    EXPECT_EQ(bad_bus.error().code, ErrorCode::MiningInvalidBatch);
}

} // namespace bundleminer::tests
