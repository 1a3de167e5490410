/**
 * @file bundle_builder.cpp
 * @brief Реализация сборки bundle
 */

#include "bundle_builder.hpp"
#include "fee_payer.hpp"
#include "../core/constants.hpp"

#include <algorithm>
#include <format>

namespace bundleminer::mining {

BundleBuilder::BundleBuilder(
    const ledger::ProgramAddresses& addresses,
    const ledger::TipRecipients& recipients
)
    : addresses_(addresses)
    , recipients_(recipients) {}

Result<Bundle> BundleBuilder::build(
    std::span<const Identity> identities,
    std::span<const SolveResult> results,
    const rpc::BalanceMap& balances,
    const Hash256& blockhash,
    const ledger::Bus& bus,
    uint64_t tip
) const {
    if (identities.empty() || identities.size() != results.size() ||
        identities.size() > constants::MAX_IDENTITIES_PER_BUNDLE) {
        return Err<Bundle>(
            ErrorCode::MiningInvalidBatch,
            std::format("Некорректный пакет: {} ключей, {} решений",
                        identities.size(), results.size())
        );
    }
    if (bus.id >= constants::BUS_COUNT) {
        return Err<Bundle>(
            ErrorCode::MiningInvalidBatch,
            std::format("Некорректный bus {}", bus.id)
        );
    }

    const auto all_keys = pubkeys_of(identities);
    auto tipper = pick_fee_payer(balances, all_keys);
    if (!tipper) {
        return std::unexpected(tipper.error());
    }

    Bundle bundle;
    bundle.tipper = *tipper;
    bundle.tip = tip;

    const auto& recipient = recipients_.pick();

    for (std::size_t begin = 0; begin < identities.size();
         begin += constants::MAX_IDENTITIES_PER_TRANSACTION) {
        const std::size_t end = std::min(begin + constants::MAX_IDENTITIES_PER_TRANSACTION,
                                         identities.size());
        const auto chunk = identities.subspan(begin, end - begin);

        const auto chunk_keys = std::span<const ledger::Pubkey>(all_keys).subspan(begin, end - begin);
        auto payer = pick_fee_payer(balances, chunk_keys);
        if (!payer) {
            return std::unexpected(payer.error());
        }

        std::vector<ledger::Instruction> instructions;
        std::vector<const crypto::Keypair*> signers;
        instructions.reserve(chunk.size() + 1);
        signers.reserve(chunk.size());

        bool carries_tip = false;
        for (std::size_t i = 0; i < chunk.size(); ++i) {
            const auto& identity = chunk[i];
            const auto& result = results[begin + i];

            instructions.push_back(addresses_.mine(
                identity.pubkey(), identity.proof, bus.id, result.hash, result.nonce));
            signers.push_back(identity.keypair.get());

            if (identity.pubkey() == bundle.tipper) {
                instructions.push_back(addresses_.transfer(bundle.tipper, recipient, tip));
                carries_tip = true;
            }
        }

        auto tx = ledger::Transaction::build(instructions, *payer, signers, blockhash);
        if (!tx) {
            return std::unexpected(tx.error());
        }

        uint64_t cost = constants::FEE_PER_SIGNER * signers.size();
        if (carries_tip) {
            cost += tip;
        }

        bundle.transactions.push_back(std::move(*tx));
        bundle.fee_charges.push_back(FeeCharge{*payer, cost});
    }

    return bundle;
}

} // namespace bundleminer::mining
