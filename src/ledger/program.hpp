/**
 * @file program.hpp
 * @brief Адреса и инструкции программы майнинга
 *
 * ProgramAddresses вычисляется один раз при старте из адреса программы
 * и mint токена: treasury, 8 bus аккаунтов, token аккаунт treasury.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"
#include "pubkey.hpp"
#include "transaction.hpp"

#include <array>
#include <random>

namespace bundleminer::ledger {

/**
 * @brief Системные программы и sysvar
 */
struct WellKnown {
    Pubkey system_program;
    Pubkey token_program;
    Pubkey associated_token_program;
    Pubkey clock_sysvar;
    Pubkey slot_hashes_sysvar;

    /// @brief Разобрать константы (ошибка означает повреждённую сборку)
    [[nodiscard]] static Result<WellKnown> load();
};

/**
 * @brief Выведенные адреса программы майнинга
 */
struct ProgramAddresses {
    Pubkey program_id;
    Pubkey mint;
    Pubkey treasury;
    Pubkey treasury_tokens;
    std::array<Pubkey, constants::BUS_COUNT> buses{};
    WellKnown well_known;

    /**
     * @brief Вывести все адреса
     *
     * @param program_id Адрес программы майнинга (Base58)
     * @param mint Адрес mint токена награды (Base58)
     */
    [[nodiscard]] static Result<ProgramAddresses> derive(
        std::string_view program_id,
        std::string_view mint
    );

    /// @brief Адрес proof аккаунта ключа
    [[nodiscard]] Result<Pubkey> proof_address(const Pubkey& authority) const;

    /// @brief Associated token аккаунт владельца для mint награды
    [[nodiscard]] Result<Pubkey> token_account(const Pubkey& owner) const;

    /**
     * @brief Инструкция mine
     *
     * Данные: [2] | hash (32) | nonce (u64 LE)
     * Аккаунты: signer (s,w), bus (w), proof (w), treasury, slot_hashes
     */
    [[nodiscard]] Instruction mine(
        const Pubkey& signer,
        const Pubkey& proof,
        uint64_t bus_id,
        const Hash256& hash,
        uint64_t nonce
    ) const;

    /**
     * @brief Инструкция claim
     *
     * Данные: [3] | amount (u64 LE)
     * Аккаунты: signer (s,w), beneficiary (w), proof (w), treasury,
     *           treasury_tokens (w), token_program
     */
    [[nodiscard]] Instruction claim(
        const Pubkey& signer,
        const Pubkey& proof,
        const Pubkey& beneficiary,
        uint64_t amount
    ) const;

    /**
     * @brief Создание associated token аккаунта владельца для mint награды
     *
     * Данные: [0] (Create)
     * Аккаунты: payer (s,w), token account (w), owner, mint, system_program,
     *           token_program
     */
    [[nodiscard]] Result<Instruction> create_token_account(
        const Pubkey& payer,
        const Pubkey& owner
    ) const;

    /**
     * @brief Перевод lamports системной программой (используется как tip)
     */
    [[nodiscard]] Instruction transfer(
        const Pubkey& from,
        const Pubkey& to,
        uint64_t lamports
    ) const;
};

/**
 * @brief Набор получателей tip в relay
 */
class TipRecipients {
public:
    [[nodiscard]] static Result<TipRecipients> load();

    /// @brief Псевдослучайный получатель
    [[nodiscard]] const Pubkey& pick() const;

    [[nodiscard]] const std::array<Pubkey, constants::TIP_RECIPIENTS.size()>& all() const noexcept {
        return recipients_;
    }

    [[nodiscard]] bool contains(const Pubkey& key) const noexcept;

private:
    std::array<Pubkey, constants::TIP_RECIPIENTS.size()> recipients_{};
};

} // namespace bundleminer::ledger
