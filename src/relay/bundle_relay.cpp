/**
 * @file bundle_relay.cpp
 * @brief Реализация отправки bundle
 */

#include "bundle_relay.hpp"
#include "../core/constants.hpp"

#include <format>

namespace bundleminer::relay {

JitoRelay::JitoRelay(const RelayConfig& config)
    : client_(config.url, std::chrono::seconds{config.timeout_seconds}) {}

Result<std::string> JitoRelay::send_bundle(std::span<const ledger::Transaction> transactions) {
    if (transactions.empty() || transactions.size() > constants::MAX_TRANSACTIONS_PER_BUNDLE) {
        return Err<std::string>(
            ErrorCode::RelayRejected,
            std::format("Bundle должен содержать от 1 до {} транзакций, получено {}",
                        constants::MAX_TRANSACTIONS_PER_BUNDLE, transactions.size())
        );
    }

    nlohmann::json encoded = nlohmann::json::array();
    for (const auto& tx : transactions) {
        encoded.push_back(tx.to_base58());
    }

    auto result = client_.call("sendBundle", nlohmann::json::array({encoded}));
    if (!result) {
        return Err<std::string>(
            ErrorCode::RelayRejected,
            result.error().message
        );
    }

    if (!result->is_string()) {
        return Err<std::string>(
            ErrorCode::RelayParseError,
            std::format("sendBundle: ожидалась строка, получено {}", result->dump())
        );
    }
    return result->get<std::string>();
}

} // namespace bundleminer::relay
