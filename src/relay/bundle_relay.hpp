/**
 * @file bundle_relay.hpp
 * @brief Отправка bundle через relay
 *
 * Relay принимает до 5 транзакций одним атомарным пакетом: либо все
 * транзакции попадают в блок, либо ни одна. Ответ relay - непрозрачный
 * идентификатор bundle; отслеживание выполняется по первой подписи
 * первой транзакции, которую вызывающий знает заранее.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"
#include "../ledger/transaction.hpp"
#include "../rpc/json_rpc.hpp"

#include <span>
#include <string>

namespace bundleminer::relay {

/**
 * @brief Абстрактный relay
 */
class BundleRelay {
public:
    virtual ~BundleRelay() = default;

    /**
     * @brief Отправить bundle
     *
     * @param transactions Подписанные транзакции (1..5)
     * @return Result<std::string> Идентификатор bundle
     */
    [[nodiscard]] virtual Result<std::string> send_bundle(
        std::span<const ledger::Transaction> transactions
    ) = 0;
};

/**
 * @brief Relay с JSON-RPC методом sendBundle
 *
 * Параметры: [[tx_base58, ...]], результат - строка bundle id.
 */
class JitoRelay final : public BundleRelay {
public:
    explicit JitoRelay(const RelayConfig& config);

    [[nodiscard]] Result<std::string> send_bundle(
        std::span<const ledger::Transaction> transactions
    ) override;

private:
    rpc::JsonRpcClient client_;
};

} // namespace bundleminer::relay
