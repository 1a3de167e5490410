/**
 * @file transaction.cpp
 * @brief Реализация компиляции и сериализации транзакций
 */

#include "transaction.hpp"
#include "../core/byte_order.hpp"
#include "../core/constants.hpp"
#include "../core/encoding.hpp"
#include "../crypto/keypair.hpp"

#include <algorithm>
#include <format>

namespace bundleminer::ledger {

namespace {

/// @brief Ключ с объединёнными флагами всех инструкций
struct KeyEntry {
    Pubkey pubkey;
    bool is_signer = false;
    bool is_writable = false;
};

void merge_key(std::vector<KeyEntry>& keys, const Pubkey& pubkey, bool signer, bool writable) {
    auto it = std::find_if(keys.begin(), keys.end(),
                           [&](const KeyEntry& e) { return e.pubkey == pubkey; });
    if (it == keys.end()) {
        keys.push_back(KeyEntry{pubkey, signer, writable});
        return;
    }
    it->is_signer = it->is_signer || signer;
    it->is_writable = it->is_writable || writable;
}

/// @brief Номер группы для сортировки ключей
int key_group(const KeyEntry& e) noexcept {
    if (e.is_signer) {
        return e.is_writable ? 0 : 1;
    }
    return e.is_writable ? 2 : 3;
}

Result<Pubkey> read_pubkey(ByteSpan data, std::size_t& offset) {
    if (offset + constants::PUBKEY_SIZE > data.size()) {
        return Err<Pubkey>(ErrorCode::LedgerInvalidTransaction, "Обрезанный ключ");
    }
    auto key = Pubkey::from_bytes(data.subspan(offset, constants::PUBKEY_SIZE));
    offset += constants::PUBKEY_SIZE;
    return key;
}

} // namespace

// =============================================================================
// Message
// =============================================================================

Result<Message> Message::compile(
    std::span<const Instruction> instructions,
    const Pubkey& payer,
    const Hash256& blockhash
) {
    std::vector<KeyEntry> keys;
    keys.push_back(KeyEntry{payer, true, true});

    for (const auto& ix : instructions) {
        for (const auto& meta : ix.accounts) {
            merge_key(keys, meta.pubkey, meta.is_signer, meta.is_writable);
        }
        merge_key(keys, ix.program_id, false, false);
    }

    // Плательщик остаётся первым, остальные - по группам в порядке появления
    std::stable_sort(keys.begin() + 1, keys.end(),
                     [](const KeyEntry& a, const KeyEntry& b) {
                         return key_group(a) < key_group(b);
                     });

    if (keys.size() > 256) {
        return Err<Message>(ErrorCode::LedgerInvalidTransaction, "Слишком много аккаунтов");
    }

    Message message;
    message.recent_blockhash = blockhash;
    for (const auto& entry : keys) {
        message.account_keys.push_back(entry.pubkey);
        if (entry.is_signer) {
            ++message.header.num_required_signatures;
            if (!entry.is_writable) {
                ++message.header.num_readonly_signed;
            }
        } else if (!entry.is_writable) {
            ++message.header.num_readonly_unsigned;
        }
    }

    auto index_of = [&](const Pubkey& key) {
        auto it = std::find(message.account_keys.begin(), message.account_keys.end(), key);
        return static_cast<uint8_t>(it - message.account_keys.begin());
    };

    for (const auto& ix : instructions) {
        CompiledInstruction compiled;
        compiled.program_id_index = index_of(ix.program_id);
        for (const auto& meta : ix.accounts) {
            compiled.accounts.push_back(index_of(meta.pubkey));
        }
        compiled.data = ix.data;
        message.instructions.push_back(std::move(compiled));
    }

    return message;
}

Bytes Message::serialize() const {
    Bytes out;
    out.reserve(3 + 1 + account_keys.size() * constants::PUBKEY_SIZE + 32 + 64 * instructions.size());

    out.push_back(header.num_required_signatures);
    out.push_back(header.num_readonly_signed);
    out.push_back(header.num_readonly_unsigned);

    append_compact_u16(out, static_cast<uint16_t>(account_keys.size()));
    for (const auto& key : account_keys) {
        append_bytes(out, key.bytes);
    }

    append_bytes(out, recent_blockhash);

    append_compact_u16(out, static_cast<uint16_t>(instructions.size()));
    for (const auto& ix : instructions) {
        out.push_back(ix.program_id_index);
        append_compact_u16(out, static_cast<uint16_t>(ix.accounts.size()));
        append_bytes(out, ix.accounts);
        append_compact_u16(out, static_cast<uint16_t>(ix.data.size()));
        append_bytes(out, ix.data);
    }

    return out;
}

Result<Message> Message::deserialize(ByteSpan data, std::size_t& offset) {
    auto truncated = [] {
        return Err<Message>(ErrorCode::LedgerInvalidTransaction, "Обрезанное сообщение");
    };

    if (offset + 3 > data.size()) {
        return truncated();
    }

    Message message;
    message.header.num_required_signatures = data[offset++];
    message.header.num_readonly_signed = data[offset++];
    message.header.num_readonly_unsigned = data[offset++];

    auto key_count = read_compact_u16(data, offset);
    if (!key_count) {
        return truncated();
    }
    for (uint16_t i = 0; i < *key_count; ++i) {
        auto key = read_pubkey(data, offset);
        if (!key) {
            return std::unexpected(key.error());
        }
        message.account_keys.push_back(*key);
    }

    if (offset + 32 > data.size()) {
        return truncated();
    }
    std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), 32, message.recent_blockhash.begin());
    offset += 32;

    auto ix_count = read_compact_u16(data, offset);
    if (!ix_count) {
        return truncated();
    }
    for (uint16_t i = 0; i < *ix_count; ++i) {
        if (offset >= data.size()) {
            return truncated();
        }
        CompiledInstruction ix;
        ix.program_id_index = data[offset++];

        auto account_count = read_compact_u16(data, offset);
        if (!account_count || offset + *account_count > data.size()) {
            return truncated();
        }
        ix.accounts.assign(data.begin() + static_cast<std::ptrdiff_t>(offset),
                           data.begin() + static_cast<std::ptrdiff_t>(offset + *account_count));
        offset += *account_count;

        auto data_len = read_compact_u16(data, offset);
        if (!data_len || offset + *data_len > data.size()) {
            return truncated();
        }
        ix.data.assign(data.begin() + static_cast<std::ptrdiff_t>(offset),
                       data.begin() + static_cast<std::ptrdiff_t>(offset + *data_len));
        offset += *data_len;

        message.instructions.push_back(std::move(ix));
    }

    return message;
}

bool Message::is_writable(std::size_t index) const noexcept {
    const std::size_t signed_count = header.num_required_signatures;
    if (index < signed_count) {
        return index < signed_count - header.num_readonly_signed;
    }
    return index < account_keys.size() - header.num_readonly_unsigned;
}

// =============================================================================
// Transaction
// =============================================================================

Result<Transaction> Transaction::build(
    std::span<const Instruction> instructions,
    const Pubkey& payer,
    std::span<const crypto::Keypair* const> signers,
    const Hash256& blockhash
) {
    auto message = Message::compile(instructions, payer, blockhash);
    if (!message) {
        return std::unexpected(message.error());
    }

    Transaction tx;
    tx.message_ = std::move(*message);
    tx.signatures_.resize(tx.message_.header.num_required_signatures);

    const auto payload = tx.message_.serialize();
    const auto required = tx.message_.signer_keys();
    std::vector<bool> signed_flags(required.size(), false);

    for (const auto* signer : signers) {
        auto it = std::find(required.begin(), required.end(), signer->pubkey());
        if (it == required.end()) {
            return Err<Transaction>(
                ErrorCode::LedgerInvalidTransaction,
                std::format("Лишний подписант {}", signer->pubkey().to_base58())
            );
        }
        const auto index = static_cast<std::size_t>(it - required.begin());

        auto signature = signer->sign(payload);
        if (!signature) {
            return std::unexpected(signature.error());
        }
        tx.signatures_[index] = *signature;
        signed_flags[index] = true;
    }

    for (std::size_t i = 0; i < signed_flags.size(); ++i) {
        if (!signed_flags[i]) {
            return Err<Transaction>(
                ErrorCode::LedgerInvalidTransaction,
                std::format("Нет подписи для {}", required[i].to_base58())
            );
        }
    }

    if (tx.serialize().size() > constants::MAX_TRANSACTION_SIZE) {
        return Err<Transaction>(
            ErrorCode::LedgerInvalidTransaction,
            std::format("Транзакция превышает {} байт", constants::MAX_TRANSACTION_SIZE)
        );
    }

    return tx;
}

Result<Transaction> Transaction::deserialize(ByteSpan data) {
    std::size_t offset = 0;
    auto sig_count = read_compact_u16(data, offset);
    if (!sig_count) {
        return Err<Transaction>(ErrorCode::LedgerInvalidTransaction, "Некорректное число подписей");
    }

    Transaction tx;
    for (uint16_t i = 0; i < *sig_count; ++i) {
        if (offset + constants::SIGNATURE_SIZE > data.size()) {
            return Err<Transaction>(ErrorCode::LedgerInvalidTransaction, "Обрезанная подпись");
        }
        Signature sig;
        std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset),
                    constants::SIGNATURE_SIZE, sig.bytes.begin());
        offset += constants::SIGNATURE_SIZE;
        tx.signatures_.push_back(sig);
    }

    auto message = Message::deserialize(data, offset);
    if (!message) {
        return std::unexpected(message.error());
    }
    tx.message_ = std::move(*message);

    if (tx.signatures_.size() != tx.message_.header.num_required_signatures) {
        return Err<Transaction>(ErrorCode::LedgerInvalidTransaction, "Число подписей не совпадает с заголовком");
    }
    return tx;
}

Bytes Transaction::serialize() const {
    Bytes out;
    append_compact_u16(out, static_cast<uint16_t>(signatures_.size()));
    for (const auto& sig : signatures_) {
        append_bytes(out, sig.bytes);
    }
    append_bytes(out, message_.serialize());
    return out;
}

std::string Transaction::to_base58() const {
    return base58_encode(serialize());
}

std::string Transaction::to_base64() const {
    return base64_encode(serialize());
}

bool Transaction::verify() const {
    const auto payload = message_.serialize();
    const auto keys = message_.signer_keys();
    if (keys.size() != signatures_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (!crypto::Keypair::verify(keys[i], payload, signatures_[i])) {
            return false;
        }
    }
    return true;
}

} // namespace bundleminer::ledger
