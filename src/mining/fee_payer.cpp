/**
 * @file fee_payer.cpp
 * @brief Реализация выбора плательщика комиссии
 */

#include "fee_payer.hpp"

#include <format>

namespace bundleminer::mining {

Result<ledger::Pubkey> pick_fee_payer(
    const rpc::BalanceMap& balances,
    std::span<const ledger::Pubkey> candidates
) {
    if (candidates.empty()) {
        return Err<ledger::Pubkey>(ErrorCode::FeePayerNoCandidates);
    }

    const ledger::Pubkey* best = nullptr;
    uint64_t best_balance = 0;

    for (const auto& candidate : candidates) {
        auto it = balances.find(candidate);
        if (it == balances.end()) {
            return Err<ledger::Pubkey>(
                ErrorCode::FeePayerBalanceMissing,
                std::format("Нет баланса для {}", candidate.to_base58())
            );
        }
        if (best == nullptr || it->second > best_balance) {
            best = &candidate;
            best_balance = it->second;
        }
    }

    return *best;
}

} // namespace bundleminer::mining
