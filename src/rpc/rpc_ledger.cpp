/**
 * @file rpc_ledger.cpp
 * @brief Реализация запросов к леджеру
 */

#include "rpc_ledger.hpp"
#include "../core/constants.hpp"
#include "../core/encoding.hpp"

#include <algorithm>
#include <format>

namespace bundleminer::rpc {

using nlohmann::json;

namespace {

json key_list(std::span<const ledger::Pubkey> keys) {
    json list = json::array();
    for (const auto& key : keys) {
        list.push_back(key.to_base58());
    }
    return list;
}

template<typename T>
Result<T> parse_error(std::string_view method, const json::exception& e) {
    return Err<T>(
        ErrorCode::RpcParseError,
        std::format("{}: некорректный ответ: {}", method, e.what())
    );
}

Confirmation parse_confirmation(const json& value) {
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (text == "finalized") return Confirmation::Finalized;
        if (text == "confirmed") return Confirmation::Confirmed;
    }
    return Confirmation::Processed;
}

} // namespace

RpcLedger::RpcLedger(const RpcConfig& config, const ledger::ProgramAddresses& addresses)
    : client_(config.url, std::chrono::seconds{config.timeout_seconds})
    , addresses_(addresses) {}

// =============================================================================
// Аккаунты
// =============================================================================

Result<std::vector<std::optional<RpcLedger::RawAccount>>> RpcLedger::get_multiple_accounts(
    std::span<const ledger::Pubkey> keys,
    std::string_view commitment
) {
    using Accounts = std::vector<std::optional<RawAccount>>;
    Accounts accounts;
    accounts.reserve(keys.size());

    for (std::size_t offset = 0; offset < keys.size(); offset += constants::FETCH_ACCOUNT_LIMIT) {
        const auto chunk = keys.subspan(offset, std::min(constants::FETCH_ACCOUNT_LIMIT, keys.size() - offset));

        auto result = client_.call("getMultipleAccounts", json::array({
            key_list(chunk),
            {{"encoding", "base64"}, {"commitment", commitment}},
        }));
        if (!result) {
            return std::unexpected(result.error());
        }

        try {
            const auto& values = result->at("value");
            if (!values.is_array() || values.size() != chunk.size()) {
                return Err<Accounts>(ErrorCode::RpcParseError, "getMultipleAccounts: неверное число аккаунтов");
            }

            for (const auto& value : values) {
                if (value.is_null()) {
                    accounts.emplace_back(std::nullopt);
                    continue;
                }
                RawAccount raw;
                raw.lamports = value.at("lamports").get<uint64_t>();
                auto data = base64_decode(value.at("data").at(0).get<std::string>());
                if (!data) {
                    return std::unexpected(data.error());
                }
                raw.data = std::move(*data);
                accounts.emplace_back(std::move(raw));
            }
        } catch (const json::exception& e) {
            return parse_error<Accounts>("getMultipleAccounts", e);
        }
    }

    return accounts;
}

Result<ledger::ChainSnapshot> RpcLedger::fetch_snapshot() {
    std::vector<ledger::Pubkey> keys;
    keys.reserve(2 + constants::BUS_COUNT);
    keys.push_back(addresses_.treasury);
    keys.push_back(addresses_.well_known.clock_sysvar);
    keys.insert(keys.end(), addresses_.buses.begin(), addresses_.buses.end());

    auto accounts = get_multiple_accounts(keys, "processed");
    if (!accounts) {
        return std::unexpected(accounts.error());
    }

    auto missing = [](std::string_view name) {
        return Err<ledger::ChainSnapshot>(
            ErrorCode::RpcAccountNotFound,
            std::format("Аккаунт {} не существует", name)
        );
    };

    ledger::ChainSnapshot snapshot;

    if (!(*accounts)[0]) {
        return missing("treasury");
    }
    auto treasury = ledger::decode_treasury((*accounts)[0]->data);
    if (!treasury) {
        return std::unexpected(treasury.error());
    }
    snapshot.treasury = *treasury;

    if (!(*accounts)[1]) {
        return missing("clock");
    }
    auto clock = ledger::decode_clock((*accounts)[1]->data);
    if (!clock) {
        return std::unexpected(clock.error());
    }
    snapshot.clock = *clock;

    for (std::size_t i = 0; i < constants::BUS_COUNT; ++i) {
        const auto& account = (*accounts)[2 + i];
        if (!account) {
            return missing(std::format("bus {}", i));
        }
        auto bus = ledger::decode_bus(account->data);
        if (!bus) {
            return std::unexpected(bus.error());
        }
        snapshot.buses.push_back(*bus);
    }

    return snapshot;
}

Result<std::vector<ledger::Proof>> RpcLedger::fetch_proofs(
    std::span<const ledger::Pubkey> proof_addresses
) {
    auto accounts = get_multiple_accounts(proof_addresses, "processed");
    if (!accounts) {
        return std::unexpected(accounts.error());
    }

    std::vector<ledger::Proof> proofs;
    proofs.reserve(accounts->size());
    for (std::size_t i = 0; i < accounts->size(); ++i) {
        const auto& account = (*accounts)[i];
        if (!account) {
            return Err<std::vector<ledger::Proof>>(
                ErrorCode::RpcAccountNotFound,
                std::format("Proof {} не зарегистрирован", proof_addresses[i].to_base58())
            );
        }
        auto proof = ledger::decode_proof(account->data);
        if (!proof) {
            return std::unexpected(proof.error());
        }
        proofs.push_back(*proof);
    }
    return proofs;
}

Result<BalanceMap> RpcLedger::fetch_balances(std::span<const ledger::Pubkey> keys) {
    auto accounts = get_multiple_accounts(keys, "confirmed");
    if (!accounts) {
        return std::unexpected(accounts.error());
    }

    BalanceMap balances;
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if ((*accounts)[i]) {
            balances[keys[i]] = (*accounts)[i]->lamports;
        }
    }
    return balances;
}

Result<uint64_t> RpcLedger::get_balance(const ledger::Pubkey& key) {
    auto result = client_.call("getBalance", json::array({
        key.to_base58(),
        {{"commitment", "confirmed"}},
    }));
    if (!result) {
        return std::unexpected(result.error());
    }

    try {
        return result->at("value").get<uint64_t>();
    } catch (const json::exception& e) {
        return parse_error<uint64_t>("getBalance", e);
    }
}

Result<bool> RpcLedger::account_exists(const ledger::Pubkey& key) {
    auto accounts = get_multiple_accounts(std::span<const ledger::Pubkey>(&key, 1), "confirmed");
    if (!accounts) {
        return std::unexpected(accounts.error());
    }
    return accounts->front().has_value();
}

// =============================================================================
// Транзакции
// =============================================================================

Result<BlockhashInfo> RpcLedger::latest_blockhash() {
    auto result = client_.call("getLatestBlockhash", json::array({
        {{"commitment", "confirmed"}},
    }));
    if (!result) {
        return std::unexpected(result.error());
    }

    BlockhashInfo info;
    try {
        info.slot = result->at("context").at("slot").get<uint64_t>();
        const auto text = result->at("value").at("blockhash").get<std::string>();
        auto hash = base58_decode(text);
        if (!hash || hash->size() != info.blockhash.size()) {
            return Err<BlockhashInfo>(
                ErrorCode::RpcParseError,
                std::format("getLatestBlockhash: некорректный blockhash {}", text)
            );
        }
        std::copy(hash->begin(), hash->end(), info.blockhash.begin());
    } catch (const json::exception& e) {
        return parse_error<BlockhashInfo>("getLatestBlockhash", e);
    }
    return info;
}

Result<StatusReport> RpcLedger::signature_statuses(std::span<const ledger::Signature> signatures) {
    json list = json::array();
    for (const auto& sig : signatures) {
        list.push_back(sig.to_base58());
    }

    auto result = client_.call("getSignatureStatuses", json::array({list}));
    if (!result) {
        return std::unexpected(result.error());
    }

    StatusReport report;
    try {
        report.slot = result->at("context").at("slot").get<uint64_t>();
        for (const auto& value : result->at("value")) {
            if (value.is_null()) {
                report.statuses.emplace_back(std::nullopt);
                continue;
            }
            SignatureStatus status;
            status.confirmation = parse_confirmation(value.value("confirmationStatus", json()));
            if (auto err = value.find("err"); err != value.end() && !err->is_null()) {
                status.error = err->dump();
            }
            report.statuses.emplace_back(std::move(status));
        }
    } catch (const json::exception& e) {
        return parse_error<StatusReport>("getSignatureStatuses", e);
    }
    return report;
}

Result<SimulationResult> RpcLedger::simulate(const ledger::Transaction& tx) {
    auto result = client_.call("simulateTransaction", json::array({
        tx.to_base64(),
        {
            {"encoding", "base64"},
            {"sigVerify", false},
            {"replaceRecentBlockhash", true},
            {"commitment", "confirmed"},
        },
    }));
    if (!result) {
        return std::unexpected(result.error());
    }

    SimulationResult simulation;
    try {
        const auto& value = result->at("value");
        if (auto err = value.find("err"); err != value.end() && !err->is_null()) {
            simulation.error = err->dump();
        }
        if (auto logs = value.find("logs"); logs != value.end() && logs->is_array()) {
            simulation.logs = logs->get<std::vector<std::string>>();
        }
    } catch (const json::exception& e) {
        return parse_error<SimulationResult>("simulateTransaction", e);
    }
    return simulation;
}

Result<ledger::Signature> RpcLedger::send_transaction(const ledger::Transaction& tx) {
    auto result = client_.call("sendTransaction", json::array({
        tx.to_base64(),
        {
            {"encoding", "base64"},
            {"skipPreflight", false},
            {"preflightCommitment", "confirmed"},
        },
    }));
    if (!result) {
        return std::unexpected(result.error());
    }

    try {
        auto signature = ledger::Signature::from_base58(result->get<std::string>());
        if (!signature) {
            return Err<ledger::Signature>(
                ErrorCode::RpcParseError,
                std::format("sendTransaction: {}", signature.error().message)
            );
        }
        return *signature;
    } catch (const json::exception& e) {
        return parse_error<ledger::Signature>("sendTransaction", e);
    }
}

Result<uint64_t> RpcLedger::get_slot() {
    auto result = client_.call("getSlot", json::array({{{"commitment", "confirmed"}}}));
    if (!result) {
        return std::unexpected(result.error());
    }
    try {
        return result->get<uint64_t>();
    } catch (const json::exception& e) {
        return parse_error<uint64_t>("getSlot", e);
    }
}

} // namespace bundleminer::rpc
