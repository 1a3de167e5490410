/**
 * @file ledger_service.hpp
 * @brief Интерфейс запросов к леджеру
 *
 * Оркестратор работает только через этот интерфейс; в тестах он
 * заменяется детерминированной реализацией.
 */

#pragma once

#include "../core/types.hpp"
#include "../ledger/accounts.hpp"
#include "../ledger/pubkey.hpp"
#include "../ledger/transaction.hpp"

#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace bundleminer::rpc {

/// @brief Балансы ключей в lamports
using BalanceMap = std::unordered_map<ledger::Pubkey, uint64_t, ledger::PubkeyHash>;

/**
 * @brief Recent blockhash и слот, в котором он получен
 */
struct BlockhashInfo {
    Hash256 blockhash{};
    uint64_t slot = 0;
};

/**
 * @brief Уровень подтверждения транзакции
 */
enum class Confirmation {
    Processed,
    Confirmed,
    Finalized
};

[[nodiscard]] constexpr std::string_view to_string(Confirmation c) noexcept {
    switch (c) {
        case Confirmation::Processed: return "processed";
        case Confirmation::Confirmed: return "confirmed";
        case Confirmation::Finalized: return "finalized";
        default: return "unknown";
    }
}

/**
 * @brief Статус одной подписи
 */
struct SignatureStatus {
    Confirmation confirmation = Confirmation::Processed;

    /// @brief Ошибка выполнения (пусто - транзакция успешна)
    std::optional<std::string> error;

    /// @brief Подтверждена (confirmed или finalized) и без ошибки
    [[nodiscard]] bool landed() const noexcept {
        return !error && (confirmation == Confirmation::Confirmed ||
                          confirmation == Confirmation::Finalized);
    }
};

/**
 * @brief Ответ getSignatureStatuses
 *
 * statuses[i] соответствует i-й запрошенной подписи; nullopt - подпись
 * леджеру неизвестна.
 */
struct StatusReport {
    uint64_t slot = 0;
    std::vector<std::optional<SignatureStatus>> statuses;
};

/**
 * @brief Результат симуляции транзакции
 */
struct SimulationResult {
    std::optional<std::string> error;
    std::vector<std::string> logs;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

/**
 * @brief Абстрактный доступ к леджеру
 */
class LedgerService {
public:
    virtual ~LedgerService() = default;

    /**
     * @brief Treasury, Clock и все bus аккаунты одним снимком
     */
    [[nodiscard]] virtual Result<ledger::ChainSnapshot> fetch_snapshot() = 0;

    /**
     * @brief Proof аккаунты в порядке запрошенных адресов
     *
     * Отсутствующий аккаунт - ошибка RpcAccountNotFound.
     */
    [[nodiscard]] virtual Result<std::vector<ledger::Proof>> fetch_proofs(
        std::span<const ledger::Pubkey> proof_addresses
    ) = 0;

    /**
     * @brief Балансы ключей
     *
     * Ключ, для которого аккаунт не существует, в результат не попадает.
     */
    [[nodiscard]] virtual Result<BalanceMap> fetch_balances(
        std::span<const ledger::Pubkey> keys
    ) = 0;

    [[nodiscard]] virtual Result<uint64_t> get_balance(const ledger::Pubkey& key) = 0;

    [[nodiscard]] virtual Result<BlockhashInfo> latest_blockhash() = 0;

    [[nodiscard]] virtual Result<StatusReport> signature_statuses(
        std::span<const ledger::Signature> signatures
    ) = 0;

    [[nodiscard]] virtual Result<SimulationResult> simulate(
        const ledger::Transaction& tx
    ) = 0;

    [[nodiscard]] virtual Result<bool> account_exists(const ledger::Pubkey& key) = 0;

    /**
     * @brief Отправить транзакцию напрямую в леджер (без relay)
     *
     * @return Подпись транзакции, возвращённая узлом
     */
    [[nodiscard]] virtual Result<ledger::Signature> send_transaction(
        const ledger::Transaction& tx
    ) = 0;
};

} // namespace bundleminer::rpc
