/**
 * @file pooled_scheduler.cpp
 * @brief Реализация режима пула пакетов
 */

#include "pooled_scheduler.hpp"
#include "capacity_selector.hpp"
#include "../core/constants.hpp"
#include "../log/logger.hpp"
#include "../monitoring/metrics.hpp"

#include <format>

namespace bundleminer::mining {

PooledScheduler::PooledScheduler(const MiningContext& context, ResourcePool& pool, TaskGroup& tasks)
    : context_(context)
    , pool_(pool)
    , tasks_(tasks)
    , builder_(context.addresses, context.recipients)
    , watcher_(context.ledger, context.poll_interval(), context.config.slot_expiration) {}

void PooledScheduler::run(std::stop_token stop) {
    log::info("планировщик запущен batches={} batch_size={}", pool_.batch_count(), pool_.batch_size());
    while (!stop.stop_requested()) {
        run_once(stop);
        tasks_.reap();
    }
    log::info("планировщик остановлен");
}

std::size_t PooledScheduler::run_once(std::stop_token stop) {
    auto indices = pool_.drain(context_.config.max_drain);
    if (indices.empty()) {
        log::debug("нет свободных пакетов, ожидание");
        sleep_for(stop, context_.idle_wait());
        return 0;
    }

    while (true) {
        auto prepared = prepare(stop, indices);
        if (prepared) {
            tasks_.spawn([this, group = std::move(*prepared)](std::stop_token task_stop) {
                send_group(task_stop, group);
            });
            return indices.size();
        }
        if (stop.stop_requested()) {
            // При остановке пакеты возвращаются в пул, чтобы их учёт сходился
            for (auto index : indices) {
                pool_.release(index);
            }
            return indices.size();
        }
    }
}

std::optional<PreparedGroup> PooledScheduler::prepare(
    std::stop_token stop,
    std::span<const std::size_t> indices
) {
    auto& metrics = monitoring::Metrics::instance();

    auto fail = [&](std::string_view what, const Error& error) -> std::optional<PreparedGroup> {
        log::error("Не удалось получить {}: {}", what, error.message);
        metrics.inc_rpc_errors();
        sleep_for(stop, context_.error_backoff());
        return std::nullopt;
    };

    auto snapshot = context_.ledger.fetch_snapshot();
    if (!snapshot) {
        return fail("состояние программы", snapshot.error());
    }

    std::vector<ledger::Pubkey> pubkeys;
    std::vector<ledger::Pubkey> proof_addresses;
    std::vector<SolveRequest> requests;
    for (auto index : indices) {
        const auto& batch = pool_.batch(index);
        pubkeys.insert(pubkeys.end(), batch.pubkeys.begin(), batch.pubkeys.end());
        proof_addresses.insert(proof_addresses.end(), batch.proofs.begin(), batch.proofs.end());
    }

    auto balances = context_.ledger.fetch_balances(pubkeys);
    if (!balances) {
        return fail("балансы", balances.error());
    }

    auto proofs = context_.ledger.fetch_proofs(proof_addresses);
    if (!proofs) {
        return fail("proof аккаунты", proofs.error());
    }
    if (proofs->size() != pubkeys.size()) {
        return fail("proof аккаунты", Error(ErrorCode::RpcParseError,
            std::format("получено {} вместо {}", proofs->size(), pubkeys.size())));
    }

    const auto time_to_epoch = ledger::time_to_next_epoch(snapshot->treasury, snapshot->clock);
    if (time_to_epoch == std::chrono::seconds::zero()) {
        // Программа отклоняет mine до сброса treasury
        log::warn("эпоха просрочена last_reset_at={} now={}, ожидание сброса treasury",
                  snapshot->treasury.last_reset_at, snapshot->clock.unix_timestamp);
        sleep_for(stop, context_.error_backoff());
        return std::nullopt;
    }

    requests.reserve(pubkeys.size());
    for (std::size_t i = 0; i < pubkeys.size(); ++i) {
        requests.push_back(SolveRequest{(*proofs)[i].hash, pubkeys[i]});
    }

    const auto solve_start = std::chrono::steady_clock::now();
    auto results = context_.solver.solve(stop, snapshot->treasury.difficulty, requests);
    const auto solve_duration = std::chrono::steady_clock::now() - solve_start;

    if (stop.stop_requested()) {
        return std::nullopt;
    }
    if (!results) {
        log::error("Ошибка решателя: {}", results.error().message);
        sleep_for(stop, context_.error_backoff());
        return std::nullopt;
    }
    if (results->size() != requests.size()) {
        log::error("решатель вернул {} решений вместо {}", results->size(), requests.size());
        sleep_for(stop, context_.error_backoff());
        return std::nullopt;
    }

    const double solve_seconds = std::chrono::duration<double>(solve_duration).count();
    if (solve_duration > time_to_epoch) {
        log::warn("решение заняло слишком много времени, ожидание следующей эпохи");
        sleep_for(stop, context_.epoch_wait(time_to_epoch));
        return std::nullopt;
    }

    metrics.observe_solve(solve_seconds);
    log::info("решение готово accounts={} accounts.idle={} mining={:.1f}s",
              pubkeys.size(), pool_.idle_identities(), solve_seconds);

    const auto& treasury = snapshot->treasury;
    auto buses = select_buses(
        snapshot->buses,
        required_capacity(treasury.reward_rate, pubkeys.size(), constants::POOLED_BUS_HEADROOM));
    if (buses.size() > context_.config.max_buses) {
        buses.resize(context_.config.max_buses);
    }
    if (buses.empty()) {
        log::warn("нет доступных bus, ожидание следующей эпохи");
        sleep_for(stop, context_.epoch_wait(time_to_epoch));
        return std::nullopt;
    }

    auto blockhash = context_.ledger.latest_blockhash();
    if (!blockhash) {
        return fail("blockhash", blockhash.error());
    }

    PreparedGroup group;
    group.indices.assign(indices.begin(), indices.end());
    group.buses = std::move(buses);
    group.balances = std::move(*balances);
    group.results = std::move(*results);
    group.batch_reward = required_capacity(treasury.reward_rate, pool_.batch_size(), 0);
    group.slot = blockhash->slot;
    group.blockhash = blockhash->blockhash;
    group.solve_seconds = solve_seconds;
    return group;
}

void PooledScheduler::send_group(std::stop_token stop, const PreparedGroup& group) {
    auto& metrics = monitoring::Metrics::instance();

    const auto tips_now = context_.tips.snapshot();
    const uint64_t tip = tips::adaptive_tip(context_.config.tip, context_.config.max_adaptive_tip,
                                            tips_now, context_.config.adaptive_tip_floor);

    const std::size_t batch_size = pool_.batch_size();
    const auto results = std::span<const SolveResult>(group.results);

    for (std::size_t k = 0; k < group.indices.size(); ++k) {
        const std::size_t index = group.indices[k];
        const auto& batch = pool_.batch(index);
        const auto batch_results = results.subspan(k * batch_size, batch_size);
        const std::string label = std::format("batch={}", index);

        SubmissionRecord record;
        record.sent_at = std::chrono::steady_clock::now();
        record.sent_at_slot = group.slot;
        record.reward_estimate = group.batch_reward;
        record.tip_paid = tip;

        bool payer_failed = false;
        for (const auto& bus : group.buses) {
            auto bundle = builder_.build(batch.identities, batch_results, group.balances,
                                         group.blockhash, bus, tip);
            if (!bundle) {
                log::error("Не удалось собрать bundle {} bus={}: {}", label, bus.id, bundle.error().message);
                payer_failed = true;
                break;
            }

            auto bundle_id = context_.relay.send_bundle(bundle->transactions);
            if (!bundle_id) {
                log::error("Не удалось отправить bundle {} bus={} signature={}: {}", label, bus.id,
                           bundle->tracking_signature().to_base58(), bundle_id.error().message);
                metrics.inc_relay_rejections();
                continue;
            }

            metrics.inc_bundles_sent();
            metrics.add_tips_paid(bundle->tip);
            log::debug("bundle отправлен {} bus={} bundle={} signature={}", label, bus.id,
                       *bundle_id, bundle->tracking_signature().to_base58());
            record.signatures.push_back(bundle->tracking_signature());
        }

        if (payer_failed || record.signatures.empty()) {
            if (!payer_failed) {
                log::warn("ни один bundle не отправлен {}", label);
            }
            pool_.release(index);
            continue;
        }

        log::info("bundle отправлены {} mining={:.1f}s tip={} tip.p25={} tip.p50={} slot={}",
                  label, group.solve_seconds, tip, tips_now.p25, tips_now.p50, group.slot);

        tasks_.spawn([this, index, record = std::move(record)](std::stop_token watch_stop) {
            watch_batch(watch_stop, index, record);
        });

        if (stop.stop_requested()) {
            // Оставшиеся пакеты группы не отправлялись
            for (std::size_t rest = k + 1; rest < group.indices.size(); ++rest) {
                pool_.release(group.indices[rest]);
            }
            return;
        }
    }
}

void PooledScheduler::watch_batch(std::stop_token stop, std::size_t index, const SubmissionRecord& record) {
    const auto result = watcher_.watch(stop, record);
    if (!(stop.stop_requested() && result.outcome == Outcome::Dropped)) {
        record_outcome(std::format("batch={}", index), record, result, context_.tips.snapshot());
    }
    pool_.release(index);
}

} // namespace bundleminer::mining
