/**
 * @file submission_watcher.cpp
 * @brief Реализация отслеживания подтверждения
 */

#include "submission_watcher.hpp"
#include "../core/task_group.hpp"
#include "../ledger/accounts.hpp"
#include "../log/logger.hpp"
#include "../monitoring/metrics.hpp"

#include <algorithm>

namespace bundleminer::mining {

SubmissionWatcher::SubmissionWatcher(
    rpc::LedgerService& ledger,
    std::chrono::milliseconds poll_interval,
    uint64_t slot_expiration
)
    : ledger_(ledger)
    , poll_interval_(poll_interval)
    , slot_expiration_(slot_expiration) {}

WatchResult SubmissionWatcher::watch(std::stop_token stop, const SubmissionRecord& record) const {
    WatchResult result;
    result.last_slot = record.sent_at_slot;

    const uint64_t deadline = record.sent_at_slot + slot_expiration_;

    while (result.last_slot < deadline) {
        if (!sleep_for(stop, poll_interval_)) {
            break;
        }
        log::debug("проверка статуса bundle slot={} sent_at={}", result.last_slot, record.sent_at_slot);

        auto report = ledger_.signature_statuses(record.signatures);
        ++result.polls;
        if (!report) {
            log::error("Не удалось получить статус bundle slot={} sent_at={}: {}",
                       result.last_slot, record.sent_at_slot, report.error().message);
            monitoring::Metrics::instance().inc_rpc_errors();
            if (!sleep_for(stop, poll_interval_)) {
                break;
            }
            continue;
        }

        result.last_slot = report->slot;

        const std::size_t count = std::min(report->statuses.size(), record.signatures.size());
        for (std::size_t i = 0; i < count; ++i) {
            const auto& status = report->statuses[i];
            if (status && status->landed()) {
                result.outcome = Outcome::Landed;
                result.landed_signature = record.signatures[i];
                result.elapsed = std::chrono::steady_clock::now() - record.sent_at;
                return result;
            }
        }
    }

    result.outcome = Outcome::Dropped;
    result.elapsed = std::chrono::steady_clock::now() - record.sent_at;
    return result;
}

void record_outcome(
    std::string_view label,
    const SubmissionRecord& record,
    const WatchResult& result,
    const tips::TipSnapshot& tips
) {
    auto& metrics = monitoring::Metrics::instance();
    const double seconds = std::chrono::duration<double>(result.elapsed).count();

    if (result.outcome == Outcome::Landed) {
        metrics.inc_bundles_landed();
        metrics.add_rewards(record.reward_estimate);
        metrics.observe_confirmation(seconds);
        log::info("bundle подтверждён {} confirm={:.1f}s rewards={:.9f} tip={} tx={}",
                  label, seconds, ledger::amount_to_ui(record.reward_estimate),
                  record.tip_paid,
                  result.landed_signature ? result.landed_signature->to_base58() : std::string{});
    } else {
        metrics.inc_bundles_dropped();
        log::warn("bundle не подтверждён {} confirm={:.1f}s rewards={:.9f} tip={} "
                  "tips.p25={} tips.p50={} slot={}",
                  label, seconds, ledger::amount_to_ui(record.reward_estimate),
                  record.tip_paid, tips.p25, tips.p50, result.last_slot);
    }
}

} // namespace bundleminer::mining
