/**
 * @file keypair.cpp
 * @brief Реализация Ed25519 через OpenSSL EVP_PKEY
 */

#include "keypair.hpp"

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <format>
#include <fstream>
#include <memory>

namespace bundleminer::crypto {

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};

using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

EVP_PKEY_ptr private_key(const Keypair::Seed& seed) {
    return EVP_PKEY_ptr{EVP_PKEY_new_raw_private_key(
        EVP_PKEY_ED25519, nullptr, seed.data(), seed.size())};
}

} // namespace

Keypair::~Keypair() {
    OPENSSL_cleanse(seed_.data(), seed_.size());
}

Result<Keypair> Keypair::from_seed(const Seed& seed) {
    auto pkey = private_key(seed);
    if (!pkey) {
        return Err<Keypair>(ErrorCode::CryptoInvalidKey, "Не удалось создать Ed25519 ключ");
    }

    ledger::Pubkey pubkey;
    std::size_t len = pubkey.bytes.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), pubkey.bytes.data(), &len) != 1 ||
        len != pubkey.bytes.size()) {
        return Err<Keypair>(ErrorCode::CryptoInvalidKey, "Не удалось получить публичный ключ");
    }

    return Keypair(seed, pubkey);
}

Result<Keypair> Keypair::from_bytes(ByteSpan bytes) {
    if (bytes.size() != constants::KEYPAIR_SIZE) {
        return Err<Keypair>(
            ErrorCode::CryptoInvalidLength,
            std::format("Ключ должен быть {} байта, получено {}", constants::KEYPAIR_SIZE, bytes.size())
        );
    }

    Seed seed{};
    std::copy_n(bytes.begin(), seed.size(), seed.begin());
    auto keypair = from_seed(seed);
    OPENSSL_cleanse(seed.data(), seed.size());
    if (!keypair) {
        return keypair;
    }

    if (!std::equal(keypair->pubkey_.bytes.begin(), keypair->pubkey_.bytes.end(),
                    bytes.begin() + 32)) {
        return Err<Keypair>(ErrorCode::CryptoInvalidKey, "Публичный ключ не соответствует seed");
    }
    return keypair;
}

Result<Keypair> Keypair::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<Keypair>(
            ErrorCode::SystemIOError,
            std::format("Не удалось открыть файл ключа: {}", path.string())
        );
    }

    Bytes raw;
    try {
        auto json = nlohmann::json::parse(file);
        raw = json.get<Bytes>();
    } catch (const nlohmann::json::exception& e) {
        return Err<Keypair>(
            ErrorCode::CryptoInvalidKey,
            std::format("Некорректный файл ключа {}: {}", path.string(), e.what())
        );
    }

    auto keypair = from_bytes(raw);
    OPENSSL_cleanse(raw.data(), raw.size());
    if (!keypair) {
        return Err<Keypair>(
            keypair.error().code,
            std::format("{}: {}", path.string(), keypair.error().message)
        );
    }
    return keypair;
}

Result<ledger::Signature> Keypair::sign(ByteSpan message) const {
    auto pkey = private_key(seed_);
    EVP_MD_CTX_ptr ctx{EVP_MD_CTX_new()};
    if (!pkey || !ctx) {
        return Err<ledger::Signature>(ErrorCode::CryptoSignFailed);
    }

    // Ed25519 использует one-shot режим без отдельного дайджеста
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return Err<ledger::Signature>(ErrorCode::CryptoSignFailed);
    }

    ledger::Signature signature;
    std::size_t sig_len = signature.bytes.size();
    if (EVP_DigestSign(ctx.get(), signature.bytes.data(), &sig_len,
                       message.data(), message.size()) != 1 ||
        sig_len != signature.bytes.size()) {
        return Err<ledger::Signature>(ErrorCode::CryptoSignFailed);
    }
    return signature;
}

bool Keypair::verify(
    const ledger::Pubkey& pubkey,
    ByteSpan message,
    const ledger::Signature& signature
) {
    EVP_PKEY_ptr pkey{EVP_PKEY_new_raw_public_key(
        EVP_PKEY_ED25519, nullptr, pubkey.bytes.data(), pubkey.bytes.size())};
    EVP_MD_CTX_ptr ctx{EVP_MD_CTX_new()};
    if (!pkey || !ctx) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature.bytes.data(), signature.bytes.size(),
                            message.data(), message.size()) == 1;
}

} // namespace bundleminer::crypto
