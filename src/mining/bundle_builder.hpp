/**
 * @file bundle_builder.hpp
 * @brief Сборка bundle из решений пакета ключей
 *
 * Структура bundle для N ключей:
 * - ceil(N / 5) транзакций по 5 инструкций mine;
 * - плательщик каждой транзакции - самый богатый ключ её группы;
 * - ровно один tip на bundle: перевод от самого богатого ключа пакета
 *   случайному получателю, сразу после его собственной инструкции mine.
 *
 * Сборка не выполняет сетевых запросов.
 */

#pragma once

#include "identity.hpp"
#include "solver.hpp"
#include "../core/types.hpp"
#include "../ledger/accounts.hpp"
#include "../ledger/program.hpp"
#include "../ledger/transaction.hpp"
#include "../rpc/ledger_service.hpp"

#include <span>
#include <vector>

namespace bundleminer::mining {

/**
 * @brief Ожидаемые расходы плательщика одной транзакции
 */
struct FeeCharge {
    ledger::Pubkey payer;
    /// @brief FEE_PER_SIGNER * подписанты (+ tip для транзакции с tip)
    uint64_t cost = 0;
};

/**
 * @brief Готовый к отправке bundle
 */
struct Bundle {
    std::vector<ledger::Transaction> transactions;
    /// @brief Расходы по транзакциям, в порядке transactions
    std::vector<FeeCharge> fee_charges;
    /// @brief Ключ, оплачивающий tip
    ledger::Pubkey tipper;
    uint64_t tip = 0;

    /// @brief Подпись для отслеживания - первая подпись первой транзакции
    [[nodiscard]] const ledger::Signature& tracking_signature() const noexcept {
        return transactions.front().id();
    }
};

/**
 * @brief Сборщик bundle майнинга
 */
class BundleBuilder {
public:
    BundleBuilder(const ledger::ProgramAddresses& addresses, const ledger::TipRecipients& recipients);

    /**
     * @brief Собрать bundle для одного bus
     *
     * @param identities Ключи пакета (не более 25)
     * @param results Решения, парные identities по позиции
     * @param balances Балансы всех ключей пакета
     * @param blockhash Recent blockhash
     * @param bus Bus, в который отправляются решения
     * @param tip Размер tip в lamports
     *
     * @return Bundle или ошибка:
     *         MiningInvalidBatch - несовпадение размеров или пустой пакет,
     *         FeePayerBalanceMissing - неизвестен баланс ключа
     */
    [[nodiscard]] Result<Bundle> build(
        std::span<const Identity> identities,
        std::span<const SolveResult> results,
        const rpc::BalanceMap& balances,
        const Hash256& blockhash,
        const ledger::Bus& bus,
        uint64_t tip
    ) const;

private:
    const ledger::ProgramAddresses& addresses_;
    const ledger::TipRecipients& recipients_;
};

} // namespace bundleminer::mining
