/**
 * @file rpc_ledger.hpp
 * @brief Реализация LedgerService поверх JSON-RPC
 */

#pragma once

#include "ledger_service.hpp"
#include "json_rpc.hpp"
#include "../core/config.hpp"
#include "../ledger/program.hpp"

#include <memory>

namespace bundleminer::rpc {

/**
 * @brief Доступ к леджеру через JSON-RPC
 *
 * Аккаунты читаются через getMultipleAccounts (base64, commitment
 * processed) пачками не больше FETCH_ACCOUNT_LIMIT ключей.
 */
class RpcLedger final : public LedgerService {
public:
    RpcLedger(const RpcConfig& config, const ledger::ProgramAddresses& addresses);

    // Запрещаем копирование
    RpcLedger(const RpcLedger&) = delete;
    RpcLedger& operator=(const RpcLedger&) = delete;

    [[nodiscard]] Result<ledger::ChainSnapshot> fetch_snapshot() override;

    [[nodiscard]] Result<std::vector<ledger::Proof>> fetch_proofs(
        std::span<const ledger::Pubkey> proof_addresses
    ) override;

    [[nodiscard]] Result<BalanceMap> fetch_balances(
        std::span<const ledger::Pubkey> keys
    ) override;

    [[nodiscard]] Result<uint64_t> get_balance(const ledger::Pubkey& key) override;

    [[nodiscard]] Result<BlockhashInfo> latest_blockhash() override;

    [[nodiscard]] Result<StatusReport> signature_statuses(
        std::span<const ledger::Signature> signatures
    ) override;

    [[nodiscard]] Result<SimulationResult> simulate(const ledger::Transaction& tx) override;

    [[nodiscard]] Result<bool> account_exists(const ledger::Pubkey& key) override;

    [[nodiscard]] Result<ledger::Signature> send_transaction(const ledger::Transaction& tx) override;

    /// @brief Номер текущего слота (проверка подключения)
    [[nodiscard]] Result<uint64_t> get_slot();

private:
    /**
     * @brief Сырые аккаунты: nullopt для несуществующих
     */
    struct RawAccount {
        uint64_t lamports = 0;
        Bytes data;
    };

    [[nodiscard]] Result<std::vector<std::optional<RawAccount>>> get_multiple_accounts(
        std::span<const ledger::Pubkey> keys,
        std::string_view commitment
    );

    JsonRpcClient client_;
    ledger::ProgramAddresses addresses_;
};

} // namespace bundleminer::rpc
