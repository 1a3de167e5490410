/**
 * @file mining_context.hpp
 * @brief Общие зависимости режимов майнинга
 */

#pragma once

#include "solver.hpp"
#include "../core/config.hpp"
#include "../ledger/program.hpp"
#include "../relay/bundle_relay.hpp"
#include "../rpc/ledger_service.hpp"
#include "../tips/tip_feed.hpp"

#include <algorithm>
#include <chrono>

namespace bundleminer::mining {

/**
 * @brief Внешние сервисы и настройки, разделяемые воркерами
 *
 * Все ссылки должны жить дольше воркеров.
 */
struct MiningContext {
    rpc::LedgerService& ledger;
    relay::BundleRelay& relay;
    ProofSolver& solver;
    const tips::TipFeed& tips;
    const ledger::ProgramAddresses& addresses;
    const ledger::TipRecipients& recipients;
    const MiningConfig& config;

    [[nodiscard]] std::chrono::milliseconds error_backoff() const noexcept {
        return std::chrono::milliseconds{config.error_backoff_ms};
    }

    [[nodiscard]] std::chrono::milliseconds poll_interval() const noexcept {
        return std::chrono::milliseconds{config.poll_interval_ms};
    }

    [[nodiscard]] std::chrono::milliseconds idle_wait() const noexcept {
        return std::chrono::milliseconds{config.idle_wait_ms};
    }

    /**
     * @brief Пауза до смены эпохи
     *
     * Не короче error_backoff: при просроченной эпохе time_to_epoch
     * равно нулю, пока treasury не сброшен.
     */
    [[nodiscard]] std::chrono::milliseconds epoch_wait(std::chrono::seconds time_to_epoch) const noexcept {
        return std::max(std::chrono::duration_cast<std::chrono::milliseconds>(time_to_epoch),
                        error_backoff());
    }
};

} // namespace bundleminer::mining
