/**
 * @file sha256.cpp
 * @brief Реализация SHA256 через OpenSSL EVP
 */

#include "sha256.hpp"

#include <openssl/evp.h>

namespace bundleminer::crypto {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

} // namespace

struct Sha256::Impl {
    EVP_MD_CTX_ptr ctx{EVP_MD_CTX_new()};
};

Sha256::Sha256() : impl_(std::make_unique<Impl>()) {
    EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr);
}

Sha256::~Sha256() = default;
Sha256::Sha256(Sha256&&) noexcept = default;
Sha256& Sha256::operator=(Sha256&&) noexcept = default;

Sha256& Sha256::update(ByteSpan data) {
    EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size());
    return *this;
}

Hash256 Sha256::finalize() {
    Hash256 digest{};
    unsigned int len = 0;
    EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &len);
    return digest;
}

Hash256 sha256(ByteSpan data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

} // namespace bundleminer::crypto
