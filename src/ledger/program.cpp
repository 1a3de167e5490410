/**
 * @file program.cpp
 * @brief Вывод адресов и сборка инструкций программы майнинга
 */

#include "program.hpp"
#include "../core/byte_order.hpp"
#include "../crypto/pda.hpp"

#include <algorithm>
#include <format>

namespace bundleminer::ledger {

namespace {

ByteSpan as_bytes(std::string_view text) {
    return ByteSpan(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

Result<Pubkey> derive_address(std::initializer_list<ByteSpan> seeds, const Pubkey& program_id) {
    auto found = crypto::find_program_address(std::span<const ByteSpan>(seeds.begin(), seeds.size()),
                                              program_id);
    if (!found) {
        return std::unexpected(found.error());
    }
    return found->first;
}

} // namespace

// =============================================================================
// WellKnown
// =============================================================================

Result<WellKnown> WellKnown::load() {
    WellKnown wk;
    const std::pair<Pubkey*, std::string_view> entries[] = {
        {&wk.system_program, constants::SYSTEM_PROGRAM_ID},
        {&wk.token_program, constants::TOKEN_PROGRAM_ID},
        {&wk.associated_token_program, constants::ASSOCIATED_TOKEN_PROGRAM_ID},
        {&wk.clock_sysvar, constants::CLOCK_SYSVAR_ID},
        {&wk.slot_hashes_sysvar, constants::SLOT_HASHES_SYSVAR_ID},
    };
    for (const auto& [target, text] : entries) {
        auto key = Pubkey::from_base58(text);
        if (!key) {
            return std::unexpected(key.error());
        }
        *target = *key;
    }
    return wk;
}

// =============================================================================
// ProgramAddresses
// =============================================================================

Result<ProgramAddresses> ProgramAddresses::derive(
    std::string_view program_id,
    std::string_view mint
) {
    ProgramAddresses addrs;

    auto wk = WellKnown::load();
    if (!wk) {
        return std::unexpected(wk.error());
    }
    addrs.well_known = *wk;

    auto program = Pubkey::from_base58(program_id);
    if (!program) {
        return Err<ProgramAddresses>(
            ErrorCode::ConfigInvalidValue,
            std::format("program.program_id: {}", program.error().message)
        );
    }
    addrs.program_id = *program;

    auto mint_key = Pubkey::from_base58(mint);
    if (!mint_key) {
        return Err<ProgramAddresses>(
            ErrorCode::ConfigInvalidValue,
            std::format("program.mint_address: {}", mint_key.error().message)
        );
    }
    addrs.mint = *mint_key;

    auto treasury = derive_address({as_bytes(constants::TREASURY_SEED)}, addrs.program_id);
    if (!treasury) {
        return std::unexpected(treasury.error());
    }
    addrs.treasury = *treasury;

    for (std::size_t i = 0; i < constants::BUS_COUNT; ++i) {
        const uint8_t id = static_cast<uint8_t>(i);
        auto bus = derive_address({as_bytes(constants::BUS_SEED), ByteSpan(&id, 1)}, addrs.program_id);
        if (!bus) {
            return std::unexpected(bus.error());
        }
        addrs.buses[i] = *bus;
    }

    auto treasury_tokens = addrs.token_account(addrs.treasury);
    if (!treasury_tokens) {
        return std::unexpected(treasury_tokens.error());
    }
    addrs.treasury_tokens = *treasury_tokens;

    return addrs;
}

Result<Pubkey> ProgramAddresses::proof_address(const Pubkey& authority) const {
    return derive_address({as_bytes(constants::PROOF_SEED), authority.bytes}, program_id);
}

Result<Pubkey> ProgramAddresses::token_account(const Pubkey& owner) const {
    return derive_address(
        {owner.bytes, well_known.token_program.bytes, mint.bytes},
        well_known.associated_token_program
    );
}

Instruction ProgramAddresses::mine(
    const Pubkey& signer,
    const Pubkey& proof,
    uint64_t bus_id,
    const Hash256& hash,
    uint64_t nonce
) const {
    Instruction ix;
    ix.program_id = program_id;
    ix.accounts = {
        AccountMeta::writable(signer, true),
        AccountMeta::writable(buses[bus_id % constants::BUS_COUNT]),
        AccountMeta::writable(proof),
        AccountMeta::readonly(treasury),
        AccountMeta::readonly(well_known.slot_hashes_sysvar),
    };
    ix.data.reserve(1 + 32 + 8);
    ix.data.push_back(constants::MINE_INSTRUCTION);
    append_bytes(ix.data, hash);
    append_le<uint64_t>(ix.data, nonce);
    return ix;
}

Instruction ProgramAddresses::claim(
    const Pubkey& signer,
    const Pubkey& proof,
    const Pubkey& beneficiary,
    uint64_t amount
) const {
    Instruction ix;
    ix.program_id = program_id;
    ix.accounts = {
        AccountMeta::writable(signer, true),
        AccountMeta::writable(beneficiary),
        AccountMeta::writable(proof),
        AccountMeta::readonly(treasury),
        AccountMeta::writable(treasury_tokens),
        AccountMeta::readonly(well_known.token_program),
    };
    ix.data.push_back(constants::CLAIM_INSTRUCTION);
    append_le<uint64_t>(ix.data, amount);
    return ix;
}

Result<Instruction> ProgramAddresses::create_token_account(
    const Pubkey& payer,
    const Pubkey& owner
) const {
    auto tokens = token_account(owner);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }

    Instruction ix;
    ix.program_id = well_known.associated_token_program;
    ix.accounts = {
        AccountMeta::writable(payer, true),
        AccountMeta::writable(*tokens),
        AccountMeta::readonly(owner),
        AccountMeta::readonly(mint),
        AccountMeta::readonly(well_known.system_program),
        AccountMeta::readonly(well_known.token_program),
    };
    ix.data.push_back(constants::CREATE_TOKEN_ACCOUNT_INSTRUCTION);
    return ix;
}

Instruction ProgramAddresses::transfer(
    const Pubkey& from,
    const Pubkey& to,
    uint64_t lamports
) const {
    Instruction ix;
    ix.program_id = well_known.system_program;
    ix.accounts = {
        AccountMeta::writable(from, true),
        AccountMeta::writable(to),
    };
    append_le<uint32_t>(ix.data, constants::SYSTEM_TRANSFER_INSTRUCTION);
    append_le<uint64_t>(ix.data, lamports);
    return ix;
}

// =============================================================================
// TipRecipients
// =============================================================================

Result<TipRecipients> TipRecipients::load() {
    TipRecipients tips;
    for (std::size_t i = 0; i < constants::TIP_RECIPIENTS.size(); ++i) {
        auto key = Pubkey::from_base58(constants::TIP_RECIPIENTS[i]);
        if (!key) {
            return std::unexpected(key.error());
        }
        tips.recipients_[i] = *key;
    }
    return tips;
}

const Pubkey& TipRecipients::pick() const {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> dist(0, recipients_.size() - 1);
    return recipients_[dist(rng)];
}

bool TipRecipients::contains(const Pubkey& key) const noexcept {
    return std::find(recipients_.begin(), recipients_.end(), key) != recipients_.end();
}

} // namespace bundleminer::ledger
