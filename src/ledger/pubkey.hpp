/**
 * @file pubkey.hpp
 * @brief Адреса (публичные ключи) и подписи леджера
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <compare>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>

namespace bundleminer::ledger {

/**
 * @brief 32-байтный адрес аккаунта
 *
 * Текстовое представление - Base58.
 */
struct Pubkey {
    std::array<uint8_t, constants::PUBKEY_SIZE> bytes{};

    /**
     * @brief Разобрать адрес из Base58
     *
     * @return Result<Pubkey> Адрес или ErrorCode::LedgerInvalidAddress
     */
    [[nodiscard]] static Result<Pubkey> from_base58(std::string_view text);

    /// @brief Адрес из сырых байт (ровно 32 байта)
    [[nodiscard]] static Result<Pubkey> from_bytes(ByteSpan data);

    [[nodiscard]] std::string to_base58() const;

    /// @brief Сокращённая запись для логов (первые 6 символов Base58)
    [[nodiscard]] std::string short_str() const;

    [[nodiscard]] bool is_zero() const noexcept {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    auto operator<=>(const Pubkey&) const = default;
};

/**
 * @brief 64-байтная подпись Ed25519
 *
 * Первая подпись транзакции служит её идентификатором.
 */
struct Signature {
    std::array<uint8_t, constants::SIGNATURE_SIZE> bytes{};

    [[nodiscard]] static Result<Signature> from_base58(std::string_view text);

    [[nodiscard]] std::string to_base58() const;

    auto operator<=>(const Signature&) const = default;
};

/**
 * @brief Хеш-функтор для использования в unordered контейнерах
 */
struct PubkeyHash {
    std::size_t operator()(const Pubkey& key) const noexcept {
        // Адреса равномерно распределены, первых 8 байт достаточно
        std::size_t value;
        std::memcpy(&value, key.bytes.data(), sizeof(value));
        return value;
    }
};

} // namespace bundleminer::ledger
