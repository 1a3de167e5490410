/**
 * @file fixed_worker.cpp
 * @brief Реализация режима фиксированных воркеров
 */

#include "fixed_worker.hpp"
#include "capacity_selector.hpp"
#include "../core/constants.hpp"
#include "../core/task_group.hpp"
#include "../log/logger.hpp"
#include "../monitoring/metrics.hpp"

#include <algorithm>
#include <format>

namespace bundleminer::mining {

namespace {

/// @brief Шаг ожидания permit между проверками остановки
constexpr auto PERMIT_POLL = std::chrono::milliseconds(100);

/**
 * @brief Permit семафора, освобождаемый при выходе из области
 */
class PermitGuard {
public:
    explicit PermitGuard(PermitSemaphore& semaphore) noexcept : semaphore_(semaphore) {}
    ~PermitGuard() { release(); }

    // Запрещаем копирование
    PermitGuard(const PermitGuard&) = delete;
    PermitGuard& operator=(const PermitGuard&) = delete;

    /// @brief Ждать permit; false если запрошена остановка
    [[nodiscard]] bool acquire(std::stop_token stop) {
        while (!semaphore_.try_acquire_for(PERMIT_POLL)) {
            if (stop.stop_requested()) {
                return false;
            }
        }
        held_ = true;
        return true;
    }

    void release() noexcept {
        if (held_) {
            semaphore_.release();
            held_ = false;
        }
    }

private:
    PermitSemaphore& semaphore_;
    bool held_ = false;
};

} // namespace

FixedWorker::FixedWorker(
    std::size_t id,
    std::vector<Identity> identities,
    const MiningContext& context,
    PermitSemaphore& permits
)
    : id_(id)
    , label_(std::format("miner={}", id))
    , identities_(std::move(identities))
    , pubkeys_(pubkeys_of(identities_))
    , proofs_(proofs_of(identities_))
    , context_(context)
    , permits_(permits)
    , builder_(context.addresses, context.recipients)
    , watcher_(context.ledger, context.poll_interval(), context.config.slot_expiration)
    , tip_(context.config.tip) {}

void FixedWorker::run(std::stop_token stop) {
    log::info("воркер запущен {} accounts={}", label_, identities_.size());
    while (!stop.stop_requested()) {
        const auto outcome = run_cycle(stop);
        log::debug("цикл завершён {} outcome={}", label_, to_string(outcome));
    }
    log::info("воркер остановлен {}", label_);
}

CycleOutcome FixedWorker::run_cycle(std::stop_token stop) {
    auto& metrics = monitoring::Metrics::instance();

    // Балансы запрашиваются до очереди за permit
    auto balances = context_.ledger.fetch_balances(pubkeys_);
    if (!balances) {
        log::error("Не удалось получить балансы {}: {}", label_, balances.error().message);
        metrics.inc_rpc_errors();
        return sleep_for(stop, context_.error_backoff()) ? CycleOutcome::Retry : CycleOutcome::Stopped;
    }

    const auto queue_start = std::chrono::steady_clock::now();
    PermitGuard permit(permits_);
    if (!permit.acquire(stop)) {
        return CycleOutcome::Stopped;
    }
    const auto queue_duration = std::chrono::steady_clock::now() - queue_start;

    auto snapshot = context_.ledger.fetch_snapshot();
    if (!snapshot) {
        log::error("Не удалось получить состояние программы {}: {}", label_, snapshot.error().message);
        metrics.inc_rpc_errors();
        return sleep_for(stop, context_.error_backoff()) ? CycleOutcome::Retry : CycleOutcome::Stopped;
    }

    auto proofs = context_.ledger.fetch_proofs(proofs_);
    if (!proofs) {
        log::error("Не удалось получить proof аккаунты {}: {}", label_, proofs.error().message);
        metrics.inc_rpc_errors();
        return sleep_for(stop, context_.error_backoff()) ? CycleOutcome::Retry : CycleOutcome::Stopped;
    }

    if (proofs->size() != identities_.size()) {
        log::error("получено {} proof аккаунтов вместо {} {}", proofs->size(), identities_.size(), label_);
        return sleep_for(stop, context_.error_backoff()) ? CycleOutcome::Retry : CycleOutcome::Stopped;
    }

    const auto time_to_epoch = ledger::time_to_next_epoch(snapshot->treasury, snapshot->clock);
    if (time_to_epoch == std::chrono::seconds::zero()) {
        // Программа отклоняет mine до сброса treasury
        permit.release();
        log::warn("эпоха просрочена {} last_reset_at={} now={}, ожидание сброса treasury",
                  label_, snapshot->treasury.last_reset_at, snapshot->clock.unix_timestamp);
        return sleep_for(stop, context_.error_backoff()) ? CycleOutcome::Retry : CycleOutcome::Stopped;
    }

    std::vector<SolveRequest> requests;
    requests.reserve(identities_.size());
    for (std::size_t i = 0; i < identities_.size(); ++i) {
        requests.push_back(SolveRequest{(*proofs)[i].hash, pubkeys_[i]});
    }

    const auto solve_start = std::chrono::steady_clock::now();
    auto results = context_.solver.solve(stop, snapshot->treasury.difficulty, requests);
    const auto solve_duration = std::chrono::steady_clock::now() - solve_start;

    if (stop.stop_requested()) {
        return CycleOutcome::Stopped;
    }
    if (!results) {
        log::error("Ошибка решателя {}: {}", label_, results.error().message);
        return sleep_for(stop, context_.error_backoff()) ? CycleOutcome::Retry : CycleOutcome::Stopped;
    }

    if (results->size() != identities_.size()) {
        log::error("решатель вернул {} решений вместо {} {}", results->size(), identities_.size(), label_);
        return sleep_for(stop, context_.error_backoff()) ? CycleOutcome::Retry : CycleOutcome::Stopped;
    }

    if (solve_duration > time_to_epoch) {
        // Решения для старой эпохи отклоняются программой; permit держим до смены эпохи
        log::warn("решение заняло слишком много времени {}, ожидание следующей эпохи", label_);
        return sleep_for(stop, context_.epoch_wait(time_to_epoch)) ? CycleOutcome::Retry : CycleOutcome::Stopped;
    }
    permit.release();

    const double solve_seconds = std::chrono::duration<double>(solve_duration).count();
    const double queue_seconds = std::chrono::duration<double>(queue_duration).count();
    metrics.observe_solve(solve_seconds);
    log::debug("решение готово {} mining={:.1f}s queue={:.1f}s", label_, solve_seconds, queue_seconds);

    const auto& treasury = snapshot->treasury;
    auto buses = select_buses(
        snapshot->buses,
        required_capacity(treasury.reward_rate, identities_.size(), constants::FIXED_BUS_HEADROOM));
    if (buses.empty()) {
        log::warn("нет доступных bus {}, ожидание следующей эпохи", label_);
        return sleep_for(stop, context_.epoch_wait(time_to_epoch)) ? CycleOutcome::Retry : CycleOutcome::Stopped;
    }
    if (buses.size() > context_.config.max_buses) {
        buses.resize(context_.config.max_buses);
    }

    const uint64_t rewards = required_capacity(treasury.reward_rate, identities_.size(), 0);

    const auto tips_now = context_.tips.snapshot();
    tip_ = tips::adaptive_tip(tip_, context_.config.max_adaptive_tip, tips_now,
                              context_.config.adaptive_tip_floor);

    auto blockhash = context_.ledger.latest_blockhash();
    if (!blockhash) {
        log::error("Не удалось получить blockhash {}: {}", label_, blockhash.error().message);
        metrics.inc_rpc_errors();
        return sleep_for(stop, context_.error_backoff()) ? CycleOutcome::Retry : CycleOutcome::Stopped;
    }

    SubmissionRecord record;
    record.sent_at = std::chrono::steady_clock::now();
    record.sent_at_slot = blockhash->slot;
    record.reward_estimate = rewards;
    record.tip_paid = tip_;
    record.signatures = send_bundles(buses, *results, *balances, blockhash->blockhash);

    if (record.signatures.empty()) {
        log::warn("ни один bundle не отправлен {}", label_);
        return CycleOutcome::NotSent;
    }

    log::info("bundle отправлены {} mining={:.1f}s queue={:.1f}s tip={} tip.p25={} tip.p50={} slot={}",
              label_, solve_seconds, queue_seconds, tip_, tips_now.p25, tips_now.p50,
              record.sent_at_slot);

    const auto result = watcher_.watch(stop, record);
    record_outcome(label_, record, result, context_.tips.snapshot());

    if (stop.stop_requested() && result.outcome == Outcome::Dropped) {
        return CycleOutcome::Stopped;
    }
    return result.outcome == Outcome::Landed ? CycleOutcome::Landed : CycleOutcome::Dropped;
}

std::vector<ledger::Signature> FixedWorker::send_bundles(
    std::span<const ledger::Bus> buses,
    std::span<const SolveResult> results,
    const rpc::BalanceMap& balances,
    const Hash256& blockhash
) {
    auto& metrics = monitoring::Metrics::instance();
    std::vector<ledger::Signature> signatures;

    for (const auto& bus : buses) {
        auto bundle = builder_.build(identities_, results, balances, blockhash, bus, tip_);
        if (!bundle) {
            log::error("Не удалось собрать bundle {} bus={}: {}", label_, bus.id, bundle.error().message);
            continue;
        }

        auto bundle_id = context_.relay.send_bundle(bundle->transactions);
        if (!bundle_id) {
            log::error("Не удалось отправить bundle {} bus={}: {}", label_, bus.id, bundle_id.error().message);
            metrics.inc_relay_rejections();
            continue;
        }

        metrics.inc_bundles_sent();
        metrics.add_tips_paid(bundle->tip);
        check_fee_payers(*bundle);

        log::debug("bundle отправлен {} bus={} bundle={} signature={}",
                   label_, bus.id, *bundle_id, bundle->tracking_signature().to_base58());
        signatures.push_back(bundle->tracking_signature());
    }
    return signatures;
}

void FixedWorker::check_fee_payers(const Bundle& bundle) {
    for (const auto& charge : bundle.fee_charges) {
        auto balance = context_.ledger.get_balance(charge.payer);
        if (!balance) {
            log::error("Не удалось получить баланс {} payer={}: {}",
                       label_, charge.payer.to_base58(), balance.error().message);
            continue;
        }
        if (*balance < charge.cost) {
            log::error("недостаточно баланса для комиссии {} payer={} balance={} cost={}",
                       label_, charge.payer.to_base58(), *balance, charge.cost);
        }
    }
}

std::vector<std::vector<Identity>> split_into_chunks(
    std::vector<Identity> identities,
    std::size_t batch_size
) {
    std::vector<std::vector<Identity>> chunks;
    if (batch_size == 0) {
        return chunks;
    }
    for (std::size_t begin = 0; begin < identities.size(); begin += batch_size) {
        const std::size_t end = std::min(begin + batch_size, identities.size());
        chunks.emplace_back(
            std::make_move_iterator(identities.begin() + static_cast<std::ptrdiff_t>(begin)),
            std::make_move_iterator(identities.begin() + static_cast<std::ptrdiff_t>(end)));
    }
    return chunks;
}

} // namespace bundleminer::mining
