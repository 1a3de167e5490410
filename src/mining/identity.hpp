/**
 * @file identity.hpp
 * @brief Ключи майнинга и выведенные адреса
 */

#pragma once

#include "../core/types.hpp"
#include "../crypto/keypair.hpp"
#include "../ledger/program.hpp"
#include "../ledger/pubkey.hpp"

#include <filesystem>
#include <memory>
#include <span>
#include <vector>

namespace bundleminer::mining {

/**
 * @brief Ключ майнинга
 *
 * Неизменяем и разделяется между потоками только для чтения.
 */
struct Identity {
    std::shared_ptr<const crypto::Keypair> keypair;
    /// @brief Адрес proof аккаунта ключа
    ledger::Pubkey proof;

    [[nodiscard]] const ledger::Pubkey& pubkey() const noexcept { return keypair->pubkey(); }
};

/**
 * @brief Создать Identity для ключа
 */
[[nodiscard]] Result<Identity> make_identity(
    crypto::Keypair keypair,
    const ledger::ProgramAddresses& addresses
);

/**
 * @brief Загрузить все ключи из каталога
 *
 * Каждый обычный файл каталога - JSON ключ. Файлы читаются в порядке
 * имён; любой некорректный файл - ошибка загрузки.
 *
 * @return Ключи или MiningNoIdentities для пустого каталога
 */
[[nodiscard]] Result<std::vector<Identity>> load_identities(
    const std::filesystem::path& folder,
    const ledger::ProgramAddresses& addresses
);

/// @brief Публичные адреса ключей
[[nodiscard]] std::vector<ledger::Pubkey> pubkeys_of(std::span<const Identity> identities);

/// @brief Адреса proof аккаунтов ключей
[[nodiscard]] std::vector<ledger::Pubkey> proofs_of(std::span<const Identity> identities);

} // namespace bundleminer::mining
