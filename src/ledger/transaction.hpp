/**
 * @file transaction.hpp
 * @brief Legacy транзакции леджера: компиляция, подпись, сериализация
 *
 * Формат:
 * @code
 * compact-u16 число подписей | подписи (64 байта)
 * message:
 *   header (3 байта): required_signatures, readonly_signed, readonly_unsigned
 *   compact-u16 число ключей | ключи (32 байта)
 *   recent blockhash (32 байта)
 *   compact-u16 число инструкций | инструкции:
 *     program_id_index (u8) | compact-u16 + индексы аккаунтов | compact-u16 + данные
 * @endcode
 *
 * Порядок ключей: плательщик, подписанты с записью, подписанты только
 * для чтения, остальные с записью, остальные только для чтения.
 */

#pragma once

#include "../core/types.hpp"
#include "pubkey.hpp"

#include <span>
#include <string>
#include <vector>

namespace bundleminer::crypto {
class Keypair;
}

namespace bundleminer::ledger {

/**
 * @brief Аккаунт, используемый инструкцией
 */
struct AccountMeta {
    Pubkey pubkey;
    bool is_signer = false;
    bool is_writable = false;

    [[nodiscard]] static AccountMeta writable(const Pubkey& key, bool signer = false) {
        return AccountMeta{key, signer, true};
    }

    [[nodiscard]] static AccountMeta readonly(const Pubkey& key, bool signer = false) {
        return AccountMeta{key, signer, false};
    }
};

/**
 * @brief Инструкция программы
 */
struct Instruction {
    Pubkey program_id;
    std::vector<AccountMeta> accounts;
    Bytes data;
};

struct MessageHeader {
    uint8_t num_required_signatures = 0;
    uint8_t num_readonly_signed = 0;
    uint8_t num_readonly_unsigned = 0;
};

/**
 * @brief Инструкция с индексами вместо адресов
 */
struct CompiledInstruction {
    uint8_t program_id_index = 0;
    std::vector<uint8_t> accounts;
    Bytes data;
};

/**
 * @brief Сообщение транзакции (подписываемая часть)
 */
struct Message {
    MessageHeader header;
    std::vector<Pubkey> account_keys;
    Hash256 recent_blockhash{};
    std::vector<CompiledInstruction> instructions;

    /**
     * @brief Собрать сообщение из инструкций
     *
     * @param instructions Инструкции в порядке выполнения
     * @param payer Плательщик комиссии (всегда первый ключ)
     * @param blockhash Recent blockhash
     */
    [[nodiscard]] static Result<Message> compile(
        std::span<const Instruction> instructions,
        const Pubkey& payer,
        const Hash256& blockhash
    );

    [[nodiscard]] Bytes serialize() const;

    [[nodiscard]] static Result<Message> deserialize(ByteSpan data, std::size_t& offset);

    [[nodiscard]] bool is_writable(std::size_t index) const noexcept;

    [[nodiscard]] std::span<const Pubkey> signer_keys() const noexcept {
        return std::span<const Pubkey>(account_keys).first(header.num_required_signatures);
    }
};

/**
 * @brief Подписанная транзакция
 */
class Transaction {
public:
    Transaction() = default;

    /**
     * @brief Собрать и подписать транзакцию
     *
     * @param signers Все ключи, подпись которых требуется сообщением
     *                (плательщик обязан быть среди них)
     */
    [[nodiscard]] static Result<Transaction> build(
        std::span<const Instruction> instructions,
        const Pubkey& payer,
        std::span<const crypto::Keypair* const> signers,
        const Hash256& blockhash
    );

    [[nodiscard]] static Result<Transaction> deserialize(ByteSpan data);

    [[nodiscard]] const Message& message() const noexcept { return message_; }
    [[nodiscard]] const std::vector<Signature>& signatures() const noexcept { return signatures_; }

    /// @brief Идентификатор транзакции - первая подпись
    [[nodiscard]] const Signature& id() const noexcept { return signatures_.front(); }

    [[nodiscard]] Bytes serialize() const;
    [[nodiscard]] std::string to_base58() const;
    [[nodiscard]] std::string to_base64() const;

    /// @brief Проверить все подписи
    [[nodiscard]] bool verify() const;

private:
    Message message_;
    std::vector<Signature> signatures_;
};

} // namespace bundleminer::ledger
