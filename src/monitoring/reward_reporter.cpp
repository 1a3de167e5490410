/**
 * @file reward_reporter.cpp
 * @brief Реализация отчёта о наградах
 */

#include "reward_reporter.hpp"
#include "metrics.hpp"
#include "../core/task_group.hpp"
#include "../ledger/accounts.hpp"
#include "../log/logger.hpp"

namespace bundleminer::monitoring {

RewardReporter::RewardReporter(std::chrono::seconds interval)
    : interval_(interval) {}

RewardReporter::~RewardReporter() {
    stop();
}

void RewardReporter::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void RewardReporter::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

uint64_t RewardReporter::report_once() {
    auto& metrics = Metrics::instance();
    const uint64_t rewards = metrics.take_rewards();
    if (rewards > 0) {
        log::info("награда добыта rewards={:.9f}", ledger::amount_to_ui(rewards));
    }
    log::info("статистика {}", metrics.summary());
    return rewards;
}

void RewardReporter::run(std::stop_token stop) {
    const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(interval_);
    while (sleep_for(stop, interval)) {
        report_once();
    }
}

} // namespace bundleminer::monitoring
