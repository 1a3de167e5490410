/**
 * @file keypair.hpp
 * @brief Ed25519 ключи подписи транзакций
 *
 * Формат файла ключа: JSON массив из 64 чисел
 * (32 байта seed, затем 32 байта публичного ключа).
 */

#pragma once

#include "../core/types.hpp"
#include "../ledger/pubkey.hpp"

#include <array>
#include <filesystem>

namespace bundleminer::crypto {

/**
 * @brief Пара ключей Ed25519
 *
 * Неизменяема после создания. Подпись выполняется через OpenSSL EVP.
 */
class Keypair {
public:
    using Seed = std::array<uint8_t, 32>;

    /**
     * @brief Создать ключ из 32-байтного seed
     */
    [[nodiscard]] static Result<Keypair> from_seed(const Seed& seed);

    /**
     * @brief Создать ключ из 64 байт (seed + pubkey)
     *
     * Публичная часть проверяется на соответствие seed.
     */
    [[nodiscard]] static Result<Keypair> from_bytes(ByteSpan bytes);

    /**
     * @brief Загрузить ключ из JSON файла
     */
    [[nodiscard]] static Result<Keypair> load_file(const std::filesystem::path& path);

    ~Keypair();
    Keypair(const Keypair&) = default;
    Keypair& operator=(const Keypair&) = default;

    [[nodiscard]] const ledger::Pubkey& pubkey() const noexcept { return pubkey_; }

    /**
     * @brief Подписать сообщение
     *
     * @return Result<Signature> 64-байтная подпись или CryptoSignFailed
     */
    [[nodiscard]] Result<ledger::Signature> sign(ByteSpan message) const;

    /**
     * @brief Проверить подпись
     */
    [[nodiscard]] static bool verify(
        const ledger::Pubkey& pubkey,
        ByteSpan message,
        const ledger::Signature& signature
    );

private:
    Keypair(const Seed& seed, const ledger::Pubkey& pubkey)
        : seed_(seed), pubkey_(pubkey) {}

    Seed seed_{};
    ledger::Pubkey pubkey_;
};

} // namespace bundleminer::crypto
