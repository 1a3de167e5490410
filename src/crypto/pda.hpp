/**
 * @file pda.hpp
 * @brief Program-derived адреса
 *
 * Адрес = SHA256(seeds || bump || program_id || "ProgramDerivedAddress"),
 * при этом результат не должен лежать на кривой Ed25519 (у такого адреса
 * не может быть приватного ключа). find_program_address перебирает bump
 * от 255 вниз до первого адреса вне кривой.
 */

#pragma once

#include "../core/types.hpp"
#include "../ledger/pubkey.hpp"

#include <span>
#include <utility>

namespace bundleminer::crypto {

/// @brief Максимальное количество seed
inline constexpr std::size_t MAX_SEEDS = 16;

/// @brief Максимальная длина одного seed
inline constexpr std::size_t MAX_SEED_LEN = 32;

/**
 * @brief Проверить, является ли 32-байтная строка точкой Ed25519
 *
 * Декомпрессия точки: y из младших 255 бит, x^2 = (y^2 - 1) / (d*y^2 + 1)
 * должен быть квадратичным вычетом по модулю 2^255 - 19.
 */
[[nodiscard]] bool is_on_curve(const ledger::Pubkey& point);

/**
 * @brief Вычислить адрес для заданных seed (включая bump)
 *
 * @return Адрес или LedgerNoProgramAddress если результат на кривой
 */
[[nodiscard]] Result<ledger::Pubkey> create_program_address(
    std::span<const ByteSpan> seeds,
    const ledger::Pubkey& program_id
);

/**
 * @brief Найти адрес и bump
 *
 * @return Пара (адрес, bump)
 */
[[nodiscard]] Result<std::pair<ledger::Pubkey, uint8_t>> find_program_address(
    std::span<const ByteSpan> seeds,
    const ledger::Pubkey& program_id
);

} // namespace bundleminer::crypto
