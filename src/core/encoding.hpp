/**
 * @file encoding.hpp
 * @brief Текстовые кодировки адресов и транзакций
 *
 * - Base58: адреса, подписи и транзакции для relay
 * - Base64: данные аккаунтов из RPC и транзакции для sendTransaction
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace bundleminer {

/// @brief Алфавит Base58 (без 0, O, I, l)
inline constexpr std::string_view BASE58_ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

/**
 * @brief Закодировать байты в Base58
 *
 * Ведущие нулевые байты кодируются символами '1'.
 */
[[nodiscard]] std::string base58_encode(ByteSpan data);

/**
 * @brief Декодировать Base58 строку
 *
 * @return Result<Bytes> Байты или ErrorCode::LedgerInvalidAddress
 *         при недопустимом символе
 */
[[nodiscard]] Result<Bytes> base58_decode(std::string_view str);

/**
 * @brief Закодировать байты в Base64 (стандартный алфавит, с паддингом)
 */
[[nodiscard]] std::string base64_encode(ByteSpan data);

/**
 * @brief Декодировать Base64 строку
 *
 * @return Result<Bytes> Байты или ErrorCode::RpcParseError
 */
[[nodiscard]] Result<Bytes> base64_decode(std::string_view str);

} // namespace bundleminer
