/**
 * @file capacity_selector.cpp
 * @brief Реализация выбора bus
 */

#include "capacity_selector.hpp"

#include <algorithm>
#include <limits>

namespace bundleminer::mining {

std::vector<ledger::Bus> select_buses(std::span<const ledger::Bus> buses, uint64_t required) {
    std::vector<ledger::Bus> selected;
    selected.reserve(buses.size());
    for (const auto& bus : buses) {
        if (bus.rewards >= required) {
            selected.push_back(bus);
        }
    }

    std::stable_sort(selected.begin(), selected.end(),
        [](const ledger::Bus& a, const ledger::Bus& b) {
            return a.rewards > b.rewards;
        });
    return selected;
}

uint64_t required_capacity(
    uint64_t reward_rate,
    std::size_t identity_count,
    std::size_t headroom
) noexcept {
    const uint64_t units = static_cast<uint64_t>(identity_count) + headroom;
    if (units != 0 && reward_rate > std::numeric_limits<uint64_t>::max() / units) {
        return std::numeric_limits<uint64_t>::max();
    }
    return reward_rate * units;
}

} // namespace bundleminer::mining
