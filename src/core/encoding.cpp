/**
 * @file encoding.cpp
 * @brief Реализация Base58 и Base64
 *
 * Base64 использует OpenSSL EVP_EncodeBlock/EVP_DecodeBlock.
 */

#include "encoding.hpp"

#include <openssl/evp.h>

#include <array>
#include <format>

namespace bundleminer {

namespace {

/// @brief Обратная таблица: ASCII -> цифра Base58 (0-57) или -1
constexpr std::array<int8_t, 256> make_base58_map() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = -1;
    for (std::size_t i = 0; i < BASE58_ALPHABET.size(); ++i) {
        table[static_cast<uint8_t>(BASE58_ALPHABET[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto BASE58_MAP = make_base58_map();

} // namespace

// =============================================================================
// Base58
// =============================================================================

std::string base58_encode(ByteSpan data) {
    std::size_t leading_zeros = 0;
    while (leading_zeros < data.size() && data[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // log(256) / log(58) ~ 1.366
    std::vector<uint8_t> digits(data.size() * 138 / 100 + 1, 0);

    // Входные байты - big-endian число, делим его на 58
    for (std::size_t i = leading_zeros; i < data.size(); ++i) {
        int carry = data[i];
        for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
            carry += 256 * static_cast<int>(*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
    }

    auto it = digits.begin();
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string result(leading_zeros, '1');
    result.reserve(leading_zeros + static_cast<std::size_t>(digits.end() - it));
    for (; it != digits.end(); ++it) {
        result.push_back(BASE58_ALPHABET[*it]);
    }
    return result;
}

Result<Bytes> base58_decode(std::string_view str) {
    std::size_t leading_ones = 0;
    while (leading_ones < str.size() && str[leading_ones] == '1') {
        ++leading_ones;
    }

    // log(58) / log(256) ~ 0.733
    Bytes bytes(str.size() * 733 / 1000 + 1, 0);

    for (std::size_t i = leading_ones; i < str.size(); ++i) {
        const int digit = BASE58_MAP[static_cast<uint8_t>(str[i])];
        if (digit < 0) {
            return Err<Bytes>(
                ErrorCode::LedgerInvalidAddress,
                std::format("Недопустимый символ Base58 '{}' в позиции {}", str[i], i)
            );
        }

        int carry = digit;
        for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
            carry += 58 * static_cast<int>(*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        if (carry != 0) {
            return Err<Bytes>(ErrorCode::LedgerInvalidAddress, "Переполнение при декодировании Base58");
        }
    }

    auto it = bytes.begin();
    while (it != bytes.end() && *it == 0) {
        ++it;
    }

    Bytes result(leading_ones, 0x00);
    result.insert(result.end(), it, bytes.end());
    return result;
}

// =============================================================================
// Base64
// =============================================================================

std::string base64_encode(ByteSpan data) {
    if (data.empty()) {
        return {};
    }

    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(out.data()),
        data.data(),
        static_cast<int>(data.size())
    );
    out.resize(static_cast<std::size_t>(written));
    return out;
}

Result<Bytes> base64_decode(std::string_view str) {
    if (str.empty()) {
        return Bytes{};
    }
    if (str.size() % 4 != 0) {
        return Err<Bytes>(ErrorCode::RpcParseError, "Длина Base64 не кратна 4");
    }

    Bytes out(3 * str.size() / 4);
    const int written = EVP_DecodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(str.data()),
        static_cast<int>(str.size())
    );
    if (written < 0) {
        return Err<Bytes>(ErrorCode::RpcParseError, "Некорректная строка Base64");
    }

    // EVP_DecodeBlock не учитывает паддинг
    std::size_t padding = 0;
    if (str.ends_with("==")) {
        padding = 2;
    } else if (str.ends_with('=')) {
        padding = 1;
    }
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

} // namespace bundleminer
