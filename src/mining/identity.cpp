/**
 * @file identity.cpp
 * @brief Загрузка ключей майнинга
 */

#include "identity.hpp"

#include <algorithm>
#include <format>

namespace bundleminer::mining {

Result<Identity> make_identity(crypto::Keypair keypair, const ledger::ProgramAddresses& addresses) {
    auto proof = addresses.proof_address(keypair.pubkey());
    if (!proof) {
        return std::unexpected(proof.error());
    }
    return Identity{std::make_shared<const crypto::Keypair>(std::move(keypair)), *proof};
}

Result<std::vector<Identity>> load_identities(
    const std::filesystem::path& folder,
    const ledger::ProgramAddresses& addresses
) {
    std::error_code ec;
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(folder, ec)) {
        if (entry.is_regular_file()) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        return Err<std::vector<Identity>>(
            ErrorCode::SystemIOError,
            std::format("Не удалось прочитать каталог ключей {}: {}", folder.string(), ec.message())
        );
    }

    std::sort(files.begin(), files.end());

    std::vector<Identity> identities;
    identities.reserve(files.size());
    for (const auto& file : files) {
        auto keypair = crypto::Keypair::load_file(file);
        if (!keypair) {
            return std::unexpected(keypair.error());
        }
        auto identity = make_identity(std::move(*keypair), addresses);
        if (!identity) {
            return std::unexpected(identity.error());
        }
        identities.push_back(std::move(*identity));
    }

    if (identities.empty()) {
        return Err<std::vector<Identity>>(
            ErrorCode::MiningNoIdentities,
            std::format("В каталоге {} нет ключей", folder.string())
        );
    }
    return identities;
}

std::vector<ledger::Pubkey> pubkeys_of(std::span<const Identity> identities) {
    std::vector<ledger::Pubkey> keys;
    keys.reserve(identities.size());
    for (const auto& identity : identities) {
        keys.push_back(identity.pubkey());
    }
    return keys;
}

std::vector<ledger::Pubkey> proofs_of(std::span<const Identity> identities) {
    std::vector<ledger::Pubkey> keys;
    keys.reserve(identities.size());
    for (const auto& identity : identities) {
        keys.push_back(identity.proof);
    }
    return keys;
}

} // namespace bundleminer::mining
