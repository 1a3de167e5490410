/**
 * @file accounts.cpp
 * @brief Декодирование аккаунтов программы майнинга
 */

#include "accounts.hpp"
#include "../core/byte_order.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace bundleminer::ledger {

namespace {

template<typename T>
Result<T> check_size(ByteSpan data, std::size_t expected, std::string_view name) {
    if (data.size() < expected) {
        return Err<T>(
            ErrorCode::LedgerInvalidAccount,
            std::format("{}: {} байт, ожидалось минимум {}", name, data.size(), expected)
        );
    }
    return T{};
}

} // namespace

Result<Treasury> decode_treasury(ByteSpan data) {
    auto treasury = check_size<Treasury>(data, TREASURY_SIZE, "Treasury");
    if (!treasury) {
        return treasury;
    }

    const uint8_t* p = data.data() + constants::ACCOUNT_DISCRIMINATOR_SIZE;
    treasury->bump = read_le64(p);
    p += 8;
    std::copy_n(p, 32, treasury->admin.bytes.begin());
    p += 32;
    std::copy_n(p, 32, treasury->difficulty.begin());
    p += 32;
    treasury->last_reset_at = read_le64_signed(p);
    p += 8;
    treasury->reward_rate = read_le64(p);
    p += 8;
    treasury->total_claimed_rewards = read_le64(p);
    return treasury;
}

Result<Bus> decode_bus(ByteSpan data) {
    auto bus = check_size<Bus>(data, BUS_SIZE, "Bus");
    if (!bus) {
        return bus;
    }

    const uint8_t* p = data.data() + constants::ACCOUNT_DISCRIMINATOR_SIZE;
    bus->id = read_le64(p);
    bus->rewards = read_le64(p + 8);
    return bus;
}

Result<Proof> decode_proof(ByteSpan data) {
    auto proof = check_size<Proof>(data, PROOF_SIZE, "Proof");
    if (!proof) {
        return proof;
    }

    const uint8_t* p = data.data() + constants::ACCOUNT_DISCRIMINATOR_SIZE;
    std::copy_n(p, 32, proof->authority.bytes.begin());
    p += 32;
    proof->claimable_rewards = read_le64(p);
    p += 8;
    std::copy_n(p, 32, proof->hash.begin());
    p += 32;
    proof->total_hashes = read_le64(p);
    p += 8;
    proof->total_rewards = read_le64(p);
    return proof;
}

Result<Clock> decode_clock(ByteSpan data) {
    // Sysvar без дискриминатора
    auto clock = check_size<Clock>(data, CLOCK_SIZE, "Clock");
    if (!clock) {
        return clock;
    }

    const uint8_t* p = data.data();
    clock->slot = read_le64(p);
    clock->epoch_start_timestamp = read_le64_signed(p + 8);
    clock->epoch = read_le64(p + 16);
    clock->leader_schedule_epoch = read_le64(p + 24);
    clock->unix_timestamp = read_le64_signed(p + 32);
    return clock;
}

std::chrono::seconds time_to_next_epoch(
    const Treasury& treasury,
    const Clock& clock
) noexcept {
    const int64_t next_epoch = treasury.last_reset_at + constants::EPOCH_DURATION;
    if (clock.unix_timestamp >= next_epoch) {
        return std::chrono::seconds{0};
    }
    return std::chrono::seconds{next_epoch - clock.unix_timestamp};
}

double amount_to_ui(uint64_t amount) noexcept {
    return static_cast<double>(amount) / std::pow(10.0, constants::TOKEN_DECIMALS);
}

uint64_t ui_to_amount(double ui_amount) noexcept {
    if (ui_amount <= 0.0) {
        return 0;
    }
    return static_cast<uint64_t>(std::llround(ui_amount * std::pow(10.0, constants::TOKEN_DECIMALS)));
}

} // namespace bundleminer::ledger
