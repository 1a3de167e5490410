/**
 * @file fee_payer.hpp
 * @brief Выбор плательщика комиссии
 */

#pragma once

#include "../core/types.hpp"
#include "../ledger/pubkey.hpp"
#include "../rpc/ledger_service.hpp"

#include <span>

namespace bundleminer::mining {

/**
 * @brief Кандидат с наибольшим балансом
 *
 * При равных балансах выбирается первый кандидат.
 *
 * @return Адрес плательщика,
 *         FeePayerNoCandidates для пустого списка,
 *         FeePayerBalanceMissing если баланс кандидата неизвестен
 */
[[nodiscard]] Result<ledger::Pubkey> pick_fee_payer(
    const rpc::BalanceMap& balances,
    std::span<const ledger::Pubkey> candidates
);

} // namespace bundleminer::mining
