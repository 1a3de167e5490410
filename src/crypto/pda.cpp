/**
 * @file pda.cpp
 * @brief Вывод program-derived адресов и проверка точки на кривой
 *
 * Арифметика поля 2^255 - 19 выполняется через OpenSSL BIGNUM.
 */

#include "pda.hpp"
#include "sha256.hpp"

#include <openssl/bn.h>

#include <algorithm>
#include <memory>
#include <string_view>
#include <vector>

namespace bundleminer::crypto {

namespace {

struct BN_Deleter  { void operator()(BIGNUM* p) const { BN_free(p); } };
struct BN_CTX_Del  { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };

using BN_ptr     = std::unique_ptr<BIGNUM, BN_Deleter>;
using BN_CTX_ptr = std::unique_ptr<BN_CTX, BN_CTX_Del>;

constexpr std::string_view PDA_MARKER = "ProgramDerivedAddress";

/**
 * @brief Параметры поля: p = 2^255 - 19, d = -121665/121666 mod p,
 *        (p - 1) / 2 для критерия Эйлера
 */
struct CurveParams {
    BN_ptr p{BN_new()};
    BN_ptr d{BN_new()};
    BN_ptr euler_exp{BN_new()};

    CurveParams() {
        BN_CTX_ptr ctx{BN_CTX_new()};

        BN_set_bit(p.get(), 255);
        BN_sub_word(p.get(), 19);

        BN_ptr num{BN_new()};
        BN_ptr den{BN_new()};
        BN_set_word(num.get(), 121665);
        BN_sub(num.get(), p.get(), num.get());
        BN_set_word(den.get(), 121666);
        BN_mod_inverse(den.get(), den.get(), p.get(), ctx.get());
        BN_mod_mul(d.get(), num.get(), den.get(), p.get(), ctx.get());

        BN_copy(euler_exp.get(), p.get());
        BN_sub_word(euler_exp.get(), 1);
        BN_rshift1(euler_exp.get(), euler_exp.get());
    }
};

const CurveParams& curve() {
    static const CurveParams params;
    return params;
}

} // namespace

bool is_on_curve(const ledger::Pubkey& point) {
    const auto& params = curve();
    BN_CTX_ptr ctx{BN_CTX_new()};

    // y - младшие 255 бит (старший бит - знак x)
    auto bytes = point.bytes;
    bytes[31] &= 0x7f;
    BN_ptr y{BN_lebin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr)};
    BN_nnmod(y.get(), y.get(), params.p.get(), ctx.get());

    BN_ptr y2{BN_new()};
    BN_mod_sqr(y2.get(), y.get(), params.p.get(), ctx.get());

    // u = y^2 - 1
    BN_ptr one{BN_new()};
    BN_one(one.get());
    BN_ptr u{BN_new()};
    BN_mod_sub(u.get(), y2.get(), one.get(), params.p.get(), ctx.get());

    // v = d*y^2 + 1
    BN_ptr v{BN_new()};
    BN_mod_mul(v.get(), params.d.get(), y2.get(), params.p.get(), ctx.get());
    BN_mod_add(v.get(), v.get(), one.get(), params.p.get(), ctx.get());

    // d - невычет, поэтому v != 0 для любого y
    BN_ptr v_inv{BN_mod_inverse(nullptr, v.get(), params.p.get(), ctx.get())};
    if (!v_inv) {
        return false;
    }

    BN_ptr x2{BN_new()};
    BN_mod_mul(x2.get(), u.get(), v_inv.get(), params.p.get(), ctx.get());
    if (BN_is_zero(x2.get())) {
        return true;
    }

    // Критерий Эйлера: x2^((p-1)/2) == 1
    BN_ptr legendre{BN_new()};
    BN_mod_exp(legendre.get(), x2.get(), params.euler_exp.get(), params.p.get(), ctx.get());
    return BN_is_one(legendre.get());
}

Result<ledger::Pubkey> create_program_address(
    std::span<const ByteSpan> seeds,
    const ledger::Pubkey& program_id
) {
    if (seeds.size() > MAX_SEEDS) {
        return Err<ledger::Pubkey>(ErrorCode::LedgerNoProgramAddress, "Слишком много seed");
    }

    Sha256 hasher;
    for (const auto& seed : seeds) {
        if (seed.size() > MAX_SEED_LEN) {
            return Err<ledger::Pubkey>(ErrorCode::LedgerNoProgramAddress, "Seed длиннее 32 байт");
        }
        hasher.update(seed);
    }
    hasher.update(program_id.bytes);
    hasher.update(ByteSpan(reinterpret_cast<const uint8_t*>(PDA_MARKER.data()), PDA_MARKER.size()));

    ledger::Pubkey address;
    address.bytes = hasher.finalize();

    if (is_on_curve(address)) {
        return Err<ledger::Pubkey>(ErrorCode::LedgerNoProgramAddress, "Адрес лежит на кривой");
    }
    return address;
}

Result<std::pair<ledger::Pubkey, uint8_t>> find_program_address(
    std::span<const ByteSpan> seeds,
    const ledger::Pubkey& program_id
) {
    std::vector<ByteSpan> with_bump(seeds.begin(), seeds.end());
    uint8_t bump = 255;
    with_bump.push_back(ByteSpan(&bump, 1));

    while (true) {
        auto address = create_program_address(with_bump, program_id);
        if (address) {
            return std::pair{*address, bump};
        }
        if (bump == 0) {
            break;
        }
        --bump;
    }

    return Err<std::pair<ledger::Pubkey, uint8_t>>(
        ErrorCode::LedgerNoProgramAddress,
        "Не найден bump для program address"
    );
}

} // namespace bundleminer::crypto
