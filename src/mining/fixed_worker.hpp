/**
 * @file fixed_worker.hpp
 * @brief Режим фиксированных воркеров (bundle-mine)
 *
 * Каждый воркер владеет статической группой ключей и в цикле:
 * балансы -> permit -> снимок цепочки и proof -> решение -> освобождение
 * permit -> выбор bus -> tip -> blockhash -> bundle на каждый bus ->
 * отправка -> ожидание подтверждения.
 *
 * Permit ограничивает число одновременно работающих решателей.
 */

#pragma once

#include "bundle_builder.hpp"
#include "identity.hpp"
#include "mining_context.hpp"
#include "submission_watcher.hpp"

#include <cstddef>
#include <semaphore>
#include <stop_token>
#include <string>
#include <vector>

namespace bundleminer::mining {

using PermitSemaphore = std::counting_semaphore<>;

/**
 * @brief Итог одного цикла воркера
 */
enum class CycleOutcome {
    Landed,     ///< bundle подтверждён
    Dropped,    ///< bundle отправлен, но не подтверждён
    NotSent,    ///< relay не принял ни одного bundle
    Retry,      ///< цикл прерван ошибкой или сменой эпохи
    Stopped     ///< запрошена остановка
};

[[nodiscard]] constexpr std::string_view to_string(CycleOutcome outcome) noexcept {
    switch (outcome) {
        case CycleOutcome::Landed:  return "landed";
        case CycleOutcome::Dropped: return "dropped";
        case CycleOutcome::NotSent: return "not_sent";
        case CycleOutcome::Retry:   return "retry";
        case CycleOutcome::Stopped: return "stopped";
        default: return "unknown";
    }
}

/**
 * @brief Воркер со статической группой ключей
 */
class FixedWorker {
public:
    /**
     * @param id Номер воркера (для логов)
     * @param identities Группа ключей (не более 25)
     * @param context Общие сервисы
     * @param permits Семафор одновременных решений
     */
    FixedWorker(
        std::size_t id,
        std::vector<Identity> identities,
        const MiningContext& context,
        PermitSemaphore& permits
    );

    // Запрещаем копирование
    FixedWorker(const FixedWorker&) = delete;
    FixedWorker& operator=(const FixedWorker&) = delete;

    /// @brief Выполнять циклы до остановки
    void run(std::stop_token stop);

    /// @brief Один цикл майнинга
    [[nodiscard]] CycleOutcome run_cycle(std::stop_token stop);

    [[nodiscard]] std::size_t id() const noexcept { return id_; }

    /// @brief Текущий tip (меняется адаптивно между циклами)
    [[nodiscard]] uint64_t tip() const noexcept { return tip_; }

private:
    /// @brief Отправить bundle на каждый bus, вернуть подписи принятых
    [[nodiscard]] std::vector<ledger::Signature> send_bundles(
        std::span<const ledger::Bus> buses,
        std::span<const SolveResult> results,
        const rpc::BalanceMap& balances,
        const Hash256& blockhash
    );

    /// @brief Проверить, что плательщикам хватает баланса на комиссии
    void check_fee_payers(const Bundle& bundle);

    std::size_t id_;
    std::string label_;
    std::vector<Identity> identities_;
    std::vector<ledger::Pubkey> pubkeys_;
    std::vector<ledger::Pubkey> proofs_;

    const MiningContext& context_;
    PermitSemaphore& permits_;
    BundleBuilder builder_;
    SubmissionWatcher watcher_;
    uint64_t tip_;
};

/**
 * @brief Разбить ключи на группы по batch_size
 *
 * Последняя группа может быть меньше.
 */
[[nodiscard]] std::vector<std::vector<Identity>> split_into_chunks(
    std::vector<Identity> identities,
    std::size_t batch_size
);

} // namespace bundleminer::mining
