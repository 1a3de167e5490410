/**
 * @file claim_runner.cpp
 * @brief Реализация вывода наград
 */

#include "claim_runner.hpp"
#include "fee_payer.hpp"
#include "../core/constants.hpp"
#include "../core/task_group.hpp"
#include "../log/logger.hpp"
#include "../monitoring/metrics.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace bundleminer::mining {

std::vector<ClaimUnit> plan_claim_units(
    std::span<const Identity> identities,
    std::span<const ledger::Proof> proofs
) {
    std::vector<ClaimEntry> claimable;
    const std::size_t count = std::min(identities.size(), proofs.size());
    for (std::size_t i = 0; i < count; ++i) {
        if (proofs[i].claimable_rewards > 0) {
            claimable.push_back(ClaimEntry{&identities[i], proofs[i].claimable_rewards});
        }
    }

    std::stable_sort(claimable.begin(), claimable.end(),
        [](const ClaimEntry& a, const ClaimEntry& b) {
            return a.amount > b.amount;
        });

    std::vector<ClaimUnit> units;
    for (std::size_t begin = 0; begin < claimable.size();
         begin += constants::MAX_IDENTITIES_PER_TRANSACTION) {
        if (units.empty() || units.back().transactions.size() == constants::MAX_TRANSACTIONS_PER_BUNDLE) {
            units.emplace_back();
        }
        auto& unit = units.back();

        const std::size_t end = std::min(begin + constants::MAX_IDENTITIES_PER_TRANSACTION,
                                         claimable.size());
        std::vector<ClaimEntry> entries(
            claimable.begin() + static_cast<std::ptrdiff_t>(begin),
            claimable.begin() + static_cast<std::ptrdiff_t>(end));
        for (const auto& entry : entries) {
            unit.total += entry.amount;
        }
        unit.accounts += entries.size();
        unit.transactions.push_back(std::move(entries));
    }
    return units;
}

// =============================================================================
// ClaimRunner
// =============================================================================

ClaimRunner::ClaimRunner(
    rpc::LedgerService& ledger,
    relay::BundleRelay& relay,
    const ledger::ProgramAddresses& addresses,
    const ledger::TipRecipients& recipients,
    const MiningConfig& mining,
    const ClaimConfig& claim
)
    : ledger_(ledger)
    , relay_(relay)
    , addresses_(addresses)
    , recipients_(recipients)
    , mining_(mining)
    , claim_(claim)
    , watcher_(ledger, std::chrono::milliseconds{mining.poll_interval_ms}, mining.slot_expiration) {}

Result<ledger::Pubkey> ClaimRunner::resolve_beneficiary() {
    auto owner = ledger::Pubkey::from_base58(claim_.beneficiary);
    if (!owner) {
        return Err<ledger::Pubkey>(
            ErrorCode::ConfigInvalidValue,
            std::format("claim.beneficiary: {}", owner.error().message)
        );
    }

    auto tokens = addresses_.token_account(*owner);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }
    log::info("получатель recipient={} ata={}", owner->to_base58(), tokens->to_base58());

    auto exists = ledger_.account_exists(*tokens);
    if (!exists) {
        return std::unexpected(exists.error());
    }
    if (!*exists) {
        return Err<ledger::Pubkey>(
            ErrorCode::RpcAccountNotFound,
            std::format("Token аккаунт {} не существует", tokens->to_base58())
        );
    }
    return *tokens;
}

Result<ledger::Pubkey> ClaimRunner::init_token_account(
    std::stop_token stop,
    const crypto::Keypair& owner
) {
    auto ix = addresses_.create_token_account(owner.pubkey(), owner.pubkey());
    if (!ix) {
        return std::unexpected(ix.error());
    }
    const ledger::Pubkey tokens = ix->accounts[1].pubkey;

    auto exists = ledger_.account_exists(tokens);
    if (!exists) {
        return std::unexpected(exists.error());
    }
    if (*exists) {
        log::info("token аккаунт уже существует ata={} owner={}",
                  tokens.to_base58(), owner.pubkey().to_base58());
        return tokens;
    }

    auto blockhash = ledger_.latest_blockhash();
    if (!blockhash) {
        return std::unexpected(blockhash.error());
    }

    const std::array<ledger::Instruction, 1> instructions = {*ix};
    const std::array<const crypto::Keypair*, 1> signers = {&owner};
    auto tx = ledger::Transaction::build(instructions, owner.pubkey(), signers, blockhash->blockhash);
    if (!tx) {
        return std::unexpected(tx.error());
    }

    log::info("создание token аккаунта ata={} owner={}", tokens.to_base58(), owner.pubkey().to_base58());
    auto signature = ledger_.send_transaction(*tx);
    if (!signature) {
        return std::unexpected(signature.error());
    }

    SubmissionRecord record;
    record.signatures = {*signature};
    record.sent_at_slot = blockhash->slot;

    const auto result = watcher_.watch(stop, record);
    if (result.outcome != Outcome::Landed) {
        return Err<ledger::Pubkey>(
            ErrorCode::NetworkTimeout,
            std::format("Транзакция {} не подтверждена до слота {}",
                        signature->to_base58(), result.last_slot)
        );
    }

    log::info("token аккаунт создан ata={} tx={}", tokens.to_base58(), signature->to_base58());
    return tokens;
}

Result<ClaimSummary> ClaimRunner::run_once(
    std::stop_token stop,
    std::span<const Identity> identities,
    const ledger::Pubkey& beneficiary_tokens
) {
    auto& metrics = monitoring::Metrics::instance();
    const auto backoff = std::chrono::milliseconds{mining_.error_backoff_ms};
    const auto resend_backoff = std::chrono::milliseconds{mining_.poll_interval_ms};

    auto proofs = ledger_.fetch_proofs(proofs_of(identities));
    if (!proofs) {
        return std::unexpected(proofs.error());
    }

    const auto units = plan_claim_units(identities, *proofs);

    ClaimSummary summary;
    std::size_t accounts = 0;
    for (const auto& unit : units) {
        summary.total_claimable += unit.total;
        accounts += unit.accounts;
    }
    summary.remaining = summary.total_claimable;

    log::info("всего наград: {:.9f} accounts={}", ledger::amount_to_ui(summary.total_claimable), accounts);

    const uint64_t threshold = ledger::ui_to_amount(claim_.threshold);

    for (const auto& unit : units) {
        if (unit.total < threshold) {
            log::info("награда единицы меньше порога, claim пропущен remaining={:.9f} "
                      "unit.rewards={:.9f} unit.accounts={}",
                      ledger::amount_to_ui(summary.remaining), ledger::amount_to_ui(unit.total),
                      unit.accounts);
            break;
        }

        while (true) {
            if (stop.stop_requested()) {
                return summary;
            }

            auto blockhash = ledger_.latest_blockhash();
            if (!blockhash) {
                log::error("Не удалось получить blockhash: {}", blockhash.error().message);
                metrics.inc_rpc_errors();
                sleep_for(stop, backoff);
                continue;
            }

            auto transactions = build_unit(unit, beneficiary_tokens, blockhash->blockhash);
            if (!transactions) {
                return std::unexpected(transactions.error());
            }

            if (!simulate_unit(*transactions)) {
                summary.rejected += unit.total;
                summary.remaining -= unit.total;
                ++summary.units_rejected;
                metrics.inc_simulation_rejections();
                log::warn("единица claim отклонена симуляцией unit.rewards={:.9f} unit.accounts={}",
                          ledger::amount_to_ui(unit.total), unit.accounts);
                break;
            }

            auto bundle_id = relay_.send_bundle(*transactions);
            if (!bundle_id) {
                log::error("Не удалось отправить bundle: {}", bundle_id.error().message);
                metrics.inc_relay_rejections();
                sleep_for(stop, resend_backoff);
                continue;
            }
            metrics.inc_bundles_sent();

            SubmissionRecord record;
            record.signatures = {transactions->front().id()};
            record.sent_at_slot = blockhash->slot;
            record.reward_estimate = unit.total;
            record.tip_paid = mining_.tip;

            log::info("bundle отправлен first_tx={} bundle={} remaining={:.9f} unit.rewards={:.9f} "
                      "unit.accounts={} slot={}",
                      record.signatures.front().to_base58(), *bundle_id,
                      ledger::amount_to_ui(summary.remaining), ledger::amount_to_ui(unit.total),
                      unit.accounts, record.sent_at_slot);

            const auto result = watcher_.watch(stop, record);
            if (result.outcome == Outcome::Landed) {
                summary.claimed += unit.total;
                summary.remaining -= unit.total;
                ++summary.units_landed;
                metrics.inc_bundles_landed();
                log::info("claim выполнен remaining={:.9f} unit.rewards={:.9f} unit.accounts={}",
                          ledger::amount_to_ui(summary.remaining), ledger::amount_to_ui(unit.total),
                          unit.accounts);
                break;
            }

            if (stop.stop_requested()) {
                return summary;
            }
            ++summary.units_dropped;
            metrics.inc_bundles_dropped();
            log::error("bundle не подтверждён, повтор remaining={:.9f} unit.rewards={:.9f} slot={}",
                       ledger::amount_to_ui(summary.remaining), ledger::amount_to_ui(unit.total),
                       record.sent_at_slot);
        }
    }

    return summary;
}

Result<void> ClaimRunner::run(std::stop_token stop, std::span<const Identity> identities) {
    auto beneficiary = resolve_beneficiary();
    if (!beneficiary) {
        return std::unexpected(beneficiary.error());
    }

    while (!stop.stop_requested()) {
        auto summary = run_once(stop, identities, *beneficiary);
        if (!summary) {
            if (!claim_.auto_claim) {
                return std::unexpected(summary.error());
            }
            log::error("Ошибка claim: {}", summary.error().message);
        } else {
            log::info("проход claim завершён claimed={:.9f} rejected={:.9f} remaining={:.9f}",
                      ledger::amount_to_ui(summary->claimed), ledger::amount_to_ui(summary->rejected),
                      ledger::amount_to_ui(summary->remaining));
        }

        if (!claim_.auto_claim) {
            break;
        }
        log::info("повторная проверка наград через {} с", claim_.recheck_interval);
        if (!sleep_for(stop, std::chrono::seconds{claim_.recheck_interval})) {
            break;
        }
    }
    return {};
}

Result<std::vector<ledger::Transaction>> ClaimRunner::build_unit(
    const ClaimUnit& unit,
    const ledger::Pubkey& beneficiary_tokens,
    const Hash256& blockhash
) {
    std::vector<ledger::Transaction> transactions;
    transactions.reserve(unit.transactions.size());

    for (const auto& entries : unit.transactions) {
        std::vector<ledger::Instruction> instructions;
        std::vector<const crypto::Keypair*> signers;
        for (const auto& entry : entries) {
            instructions.push_back(addresses_.claim(
                entry.identity->pubkey(), entry.identity->proof, beneficiary_tokens, entry.amount));
            signers.push_back(entry.identity->keypair.get());
        }

        const auto payer = pick_payer(entries);
        if (transactions.empty()) {
            instructions.push_back(addresses_.transfer(payer, recipients_.pick(), mining_.tip));
        }

        auto tx = ledger::Transaction::build(instructions, payer, signers, blockhash);
        if (!tx) {
            return std::unexpected(tx.error());
        }
        transactions.push_back(std::move(*tx));
    }
    return transactions;
}

bool ClaimRunner::simulate_unit(std::span<const ledger::Transaction> transactions) {
    for (const auto& tx : transactions) {
        auto result = ledger_.simulate(tx);
        if (!result) {
            log::error("Не удалось выполнить симуляцию: {}", result.error().message);
            return false;
        }
        log::debug("результат симуляции tx={} logs={}", tx.id().to_base58(), result->logs.size());
        if (!result->ok()) {
            log::error("симуляция вернула ошибку: {}", *result->error);
            return false;
        }
    }
    return true;
}

ledger::Pubkey ClaimRunner::pick_payer(std::span<const ClaimEntry> entries) {
    std::vector<ledger::Pubkey> keys;
    keys.reserve(entries.size());
    for (const auto& entry : entries) {
        keys.push_back(entry.identity->pubkey());
    }

    auto balances = ledger_.fetch_balances(keys);
    if (!balances) {
        log::error("Не удалось получить балансы подписантов: {}", balances.error().message);
        return keys.front();
    }

    auto payer = pick_fee_payer(*balances, keys);
    if (!payer) {
        log::warn("плательщик выбран по умолчанию: {}", payer.error().message);
        return keys.front();
    }
    return *payer;
}

} // namespace bundleminer::mining
