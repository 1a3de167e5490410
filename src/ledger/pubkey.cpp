/**
 * @file pubkey.cpp
 * @brief Преобразование адресов и подписей в Base58 и обратно
 */

#include "pubkey.hpp"
#include "../core/encoding.hpp"

#include <algorithm>
#include <format>

namespace bundleminer::ledger {

Result<Pubkey> Pubkey::from_base58(std::string_view text) {
    auto decoded = base58_decode(text);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    if (decoded->size() != constants::PUBKEY_SIZE) {
        return Err<Pubkey>(
            ErrorCode::LedgerInvalidAddress,
            std::format("Некорректный адрес '{}': {} байт вместо 32", text, decoded->size())
        );
    }
    Pubkey key;
    std::copy(decoded->begin(), decoded->end(), key.bytes.begin());
    return key;
}

Result<Pubkey> Pubkey::from_bytes(ByteSpan data) {
    if (data.size() != constants::PUBKEY_SIZE) {
        return Err<Pubkey>(ErrorCode::CryptoInvalidLength);
    }
    Pubkey key;
    std::copy(data.begin(), data.end(), key.bytes.begin());
    return key;
}

std::string Pubkey::to_base58() const {
    return base58_encode(bytes);
}

std::string Pubkey::short_str() const {
    auto text = to_base58();
    if (text.size() > 6) {
        text.resize(6);
    }
    return text;
}

Result<Signature> Signature::from_base58(std::string_view text) {
    auto decoded = base58_decode(text);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    if (decoded->size() != constants::SIGNATURE_SIZE) {
        return Err<Signature>(ErrorCode::CryptoInvalidLength, "Подпись должна быть 64 байта");
    }
    Signature sig;
    std::copy(decoded->begin(), decoded->end(), sig.bytes.begin());
    return sig;
}

std::string Signature::to_base58() const {
    return base58_encode(bytes);
}

} // namespace bundleminer::ledger
