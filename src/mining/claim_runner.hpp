/**
 * @file claim_runner.hpp
 * @brief Вывод накопленных наград на token аккаунт получателя
 *
 * Ключи с ненулевой наградой сортируются по убыванию суммы и
 * группируются: 5 ключей на транзакцию, до 5 транзакций на bundle
 * (единица claim). Первая транзакция единицы несёт tip.
 *
 * Каждая транзакция единицы симулируется до отправки. Отклонённая
 * симуляцией единица не отправляется, из остатка вычитается только её
 * сумма. Подтверждённая единица вычитается из остатка; неподтверждённая
 * повторяется с новым blockhash.
 */

#pragma once

#include "identity.hpp"
#include "submission_watcher.hpp"
#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../ledger/program.hpp"
#include "../ledger/transaction.hpp"
#include "../relay/bundle_relay.hpp"
#include "../rpc/ledger_service.hpp"

#include <span>
#include <stop_token>
#include <vector>

namespace bundleminer::mining {

/**
 * @brief Награда одного ключа к выводу
 */
struct ClaimEntry {
    const Identity* identity = nullptr;
    uint64_t amount = 0;
};

/**
 * @brief Единица claim: до 5 транзакций одним bundle
 */
struct ClaimUnit {
    /// @brief Ключи по транзакциям (до 5 в каждой)
    std::vector<std::vector<ClaimEntry>> transactions;
    uint64_t total = 0;
    std::size_t accounts = 0;
};

/**
 * @brief Итог одного прохода claim
 */
struct ClaimSummary {
    /// @brief Сумма наград всех ключей на момент начала прохода
    uint64_t total_claimable = 0;
    /// @brief Выведено подтверждёнными bundle
    uint64_t claimed = 0;
    /// @brief Отклонено симуляцией
    uint64_t rejected = 0;
    /// @brief Остаток (не выведено и не отклонено)
    uint64_t remaining = 0;
    std::size_t units_landed = 0;
    std::size_t units_rejected = 0;
    std::size_t units_dropped = 0;
};

/**
 * @brief Сгруппировать награды в единицы claim
 *
 * Ключи с нулевой наградой отбрасываются, остальные сортируются по
 * убыванию суммы (равные сохраняют исходный порядок).
 */
[[nodiscard]] std::vector<ClaimUnit> plan_claim_units(
    std::span<const Identity> identities,
    std::span<const ledger::Proof> proofs
);

/**
 * @brief Исполнитель claim
 */
class ClaimRunner {
public:
    ClaimRunner(
        rpc::LedgerService& ledger,
        relay::BundleRelay& relay,
        const ledger::ProgramAddresses& addresses,
        const ledger::TipRecipients& recipients,
        const MiningConfig& mining,
        const ClaimConfig& claim
    );

    // Запрещаем копирование
    ClaimRunner(const ClaimRunner&) = delete;
    ClaimRunner& operator=(const ClaimRunner&) = delete;

    /**
     * @brief Найти token аккаунт получателя и проверить, что он существует
     */
    [[nodiscard]] Result<ledger::Pubkey> resolve_beneficiary();

    /**
     * @brief Создать token аккаунт владельца, если его ещё нет
     *
     * Транзакция отправляется напрямую в леджер, владелец платит комиссию.
     * Существующий аккаунт не пересоздаётся.
     *
     * @return Адрес token аккаунта
     */
    [[nodiscard]] Result<ledger::Pubkey> init_token_account(
        std::stop_token stop,
        const crypto::Keypair& owner
    );

    /**
     * @brief Один проход claim по всем ключам
     */
    [[nodiscard]] Result<ClaimSummary> run_once(
        std::stop_token stop,
        std::span<const Identity> identities,
        const ledger::Pubkey& beneficiary_tokens
    );

    /**
     * @brief Claim с повторной проверкой (если включён auto)
     */
    [[nodiscard]] Result<void> run(std::stop_token stop, std::span<const Identity> identities);

private:
    /// @brief Подписанные транзакции единицы
    [[nodiscard]] Result<std::vector<ledger::Transaction>> build_unit(
        const ClaimUnit& unit,
        const ledger::Pubkey& beneficiary_tokens,
        const Hash256& blockhash
    );

    /// @brief Все транзакции единицы прошли симуляцию
    [[nodiscard]] bool simulate_unit(std::span<const ledger::Transaction> transactions);

    /// @brief Самый богатый подписант транзакции
    [[nodiscard]] ledger::Pubkey pick_payer(std::span<const ClaimEntry> entries);

    rpc::LedgerService& ledger_;
    relay::BundleRelay& relay_;
    const ledger::ProgramAddresses& addresses_;
    const ledger::TipRecipients& recipients_;
    const MiningConfig& mining_;
    const ClaimConfig& claim_;
    SubmissionWatcher watcher_;
};

} // namespace bundleminer::mining
