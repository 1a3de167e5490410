/**
 * @file metrics.cpp
 * @brief Реализация метрик майнинга bundle
 */

#include "metrics.hpp"
#include "../ledger/accounts.hpp"

#include <format>

namespace bundleminer::monitoring {

// =============================================================================
// Singleton
// =============================================================================

Metrics& Metrics::instance() {
    static Metrics instance;
    return instance;
}

Metrics::Metrics()
    : start_time_(std::chrono::steady_clock::now())
    , confirmation_histogram_(Histogram::create_confirmation_histogram())
    , solve_histogram_(Histogram::create_solve_histogram()) {}

uint64_t Metrics::get_uptime_seconds() const {
    auto now = std::chrono::steady_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count()
    );
}

// =============================================================================
// Counters
// =============================================================================

void Metrics::inc_bundles_sent() {
    bundles_sent_++;
}

void Metrics::inc_bundles_landed() {
    bundles_landed_++;
}

void Metrics::inc_bundles_dropped() {
    bundles_dropped_++;
}

void Metrics::inc_relay_rejections() {
    relay_rejections_++;
}

void Metrics::inc_rpc_errors() {
    rpc_errors_++;
}

void Metrics::inc_simulation_rejections() {
    simulation_rejections_++;
}

void Metrics::add_tips_paid(uint64_t lamports) {
    tips_paid_ += lamports;
}

void Metrics::add_rewards(uint64_t amount) {
    rewards_total_ += amount;
    rewards_pending_ += amount;
}

uint64_t Metrics::take_rewards() {
    return rewards_pending_.exchange(0);
}

// =============================================================================
// Gauges
// =============================================================================

void Metrics::set_idle_identities(int64_t count) {
    idle_identities_ = count;
}

void Metrics::add_idle_identities(int64_t delta) {
    idle_identities_ += delta;
}

void Metrics::set_tip_p50(uint64_t lamports) {
    tip_p50_ = lamports;
}

// =============================================================================
// Histograms
// =============================================================================

void Metrics::observe_confirmation(double seconds) {
    confirmation_histogram_.observe(seconds);
}

void Metrics::observe_solve(double seconds) {
    solve_histogram_.observe(seconds);
}

// =============================================================================
// Getters
// =============================================================================

uint64_t Metrics::get_bundles_sent() const {
    return bundles_sent_;
}

uint64_t Metrics::get_bundles_landed() const {
    return bundles_landed_;
}

uint64_t Metrics::get_bundles_dropped() const {
    return bundles_dropped_;
}

uint64_t Metrics::get_relay_rejections() const {
    return relay_rejections_;
}

uint64_t Metrics::get_rpc_errors() const {
    return rpc_errors_;
}

uint64_t Metrics::get_simulation_rejections() const {
    return simulation_rejections_;
}

uint64_t Metrics::get_tips_paid() const {
    return tips_paid_;
}

uint64_t Metrics::get_rewards_total() const {
    return rewards_total_;
}

int64_t Metrics::get_idle_identities() const {
    return idle_identities_;
}

uint64_t Metrics::get_tip_p50() const {
    return tip_p50_;
}

uint64_t Metrics::get_confirmation_count() const {
    return confirmation_histogram_.count;
}

double Metrics::get_confirmation_mean() const {
    return confirmation_histogram_.mean();
}

// =============================================================================
// Экспорт
// =============================================================================

std::string Metrics::summary() const {
    return std::format(
        "uptime={}s sent={} landed={} dropped={} rejected={} rpc_errors={} "
        "sim_rejected={} tips={} rewards={:.9f} idle={} tip_p50={} "
        "confirm_mean={:.1f}s solve_mean={:.1f}s",
        get_uptime_seconds(),
        bundles_sent_.load(),
        bundles_landed_.load(),
        bundles_dropped_.load(),
        relay_rejections_.load(),
        rpc_errors_.load(),
        simulation_rejections_.load(),
        tips_paid_.load(),
        ledger::amount_to_ui(rewards_total_.load()),
        idle_identities_.load(),
        tip_p50_.load(),
        confirmation_histogram_.mean(),
        solve_histogram_.mean()
    );
}

void Metrics::reset() {
    bundles_sent_ = 0;
    bundles_landed_ = 0;
    bundles_dropped_ = 0;
    relay_rejections_ = 0;
    rpc_errors_ = 0;
    simulation_rejections_ = 0;
    tips_paid_ = 0;
    rewards_total_ = 0;
    rewards_pending_ = 0;
    idle_identities_ = 0;
    tip_p50_ = 0;

    confirmation_histogram_.clear();
    solve_histogram_.clear();

    start_time_ = std::chrono::steady_clock::now();
}

} // namespace bundleminer::monitoring
