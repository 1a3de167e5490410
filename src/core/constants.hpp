/**
 * @file constants.hpp
 * @brief Константы протокола майнинга и настройки по умолчанию
 *
 * Содержит размеры структур леджера, лимиты relay и значения
 * по умолчанию для конфигурации.
 *
 * @note Все константы определены как constexpr для compile-time вычислений.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace bundleminer::constants {

// =============================================================================
// Размеры структур леджера
// =============================================================================

/// @brief Размер публичного ключа (адреса) в байтах
inline constexpr std::size_t PUBKEY_SIZE = 32;

/// @brief Размер подписи Ed25519 в байтах
inline constexpr std::size_t SIGNATURE_SIZE = 64;

/// @brief Размер keypair файла (seed + pubkey) в байтах
inline constexpr std::size_t KEYPAIR_SIZE = 64;

/// @brief Размер дискриминатора в начале аккаунтов программы майнинга
inline constexpr std::size_t ACCOUNT_DISCRIMINATOR_SIZE = 8;

/// @brief Максимальный размер сериализованной транзакции (packet data size)
inline constexpr std::size_t MAX_TRANSACTION_SIZE = 1232;

// =============================================================================
// Константы программы майнинга
// =============================================================================

/// @brief Длительность эпохи в секундах
inline constexpr int64_t EPOCH_DURATION = 60;

/// @brief Количество bus аккаунтов
inline constexpr std::size_t BUS_COUNT = 8;

/// @brief Десятичные знаки токена награды
inline constexpr unsigned TOKEN_DECIMALS = 9;

/// @brief Seed proof аккаунта
inline constexpr std::string_view PROOF_SEED = "proof";

/// @brief Seed bus аккаунта
inline constexpr std::string_view BUS_SEED = "bus";

/// @brief Seed treasury аккаунта
inline constexpr std::string_view TREASURY_SEED = "treasury";

/// @brief Дискриминатор инструкции mine
inline constexpr uint8_t MINE_INSTRUCTION = 2;

/// @brief Дискриминатор инструкции claim
inline constexpr uint8_t CLAIM_INSTRUCTION = 3;

/// @brief Индекс инструкции transfer системной программы
inline constexpr uint32_t SYSTEM_TRANSFER_INSTRUCTION = 2;

/// @brief Инструкция Create программы associated token
inline constexpr uint8_t CREATE_TOKEN_ACCOUNT_INSTRUCTION = 0;

/// @brief Адрес программы майнинга по умолчанию
inline constexpr std::string_view DEFAULT_PROGRAM_ID = "mineRHF5r6S7HyD9SppBfVMXMavDkJsxwGesEvxZr2A";

/// @brief Адрес mint токена награды по умолчанию
inline constexpr std::string_view DEFAULT_MINT_ADDRESS = "oreoN2tQbHXVaZsr3pf66A48miqcBXCDJozganhEJgz";

// =============================================================================
// Системные адреса
// =============================================================================

inline constexpr std::string_view SYSTEM_PROGRAM_ID = "11111111111111111111111111111111";
inline constexpr std::string_view TOKEN_PROGRAM_ID = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";
inline constexpr std::string_view ASSOCIATED_TOKEN_PROGRAM_ID = "ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL";
inline constexpr std::string_view CLOCK_SYSVAR_ID = "SysvarC1ock11111111111111111111111111111111";
inline constexpr std::string_view SLOT_HASHES_SYSVAR_ID = "SysvarS1otHashes111111111111111111111111111";

// =============================================================================
// Лимиты relay и комиссии
// =============================================================================

/// @brief Базовая комиссия за одну подпись (lamports)
inline constexpr uint64_t FEE_PER_SIGNER = 5000;

/// @brief Максимум транзакций в одном bundle
inline constexpr std::size_t MAX_TRANSACTIONS_PER_BUNDLE = 5;

/// @brief Максимум proof инструкций (подписантов) в одной транзакции
inline constexpr std::size_t MAX_IDENTITIES_PER_TRANSACTION = 5;

/// @brief Максимум ключей в одном bundle
inline constexpr std::size_t MAX_IDENTITIES_PER_BUNDLE =
    MAX_TRANSACTIONS_PER_BUNDLE * MAX_IDENTITIES_PER_TRANSACTION;

/// @brief Получатели tip (bribe) в relay
inline constexpr std::array<std::string_view, 8> TIP_RECIPIENTS = {
    "96gYZGLnJYVFmbjzopPSU6QiEV5fGqZNyN9nmNhvrZU5",
    "HFqU5x63VTqvQss8hp11i4wVV8bD44PvwucfZ2bU7gRe",
    "Cw8CFyM9FkoMi7K7Crf6HNQqf4uEMzpKw6QNghXLvLkY",
    "ADaUMid9yfUytqMBgopwjb2DTLSokTSzL1zt6iGPaS49",
    "DfXygSm4jCyNCybVYYK6DwvWqjKee8pbDmJGcLWNDXjh",
    "ADuUkR4vqLUMWXxW9gh6D6L8pMSawimctcNZ5pGwDcEt",
    "DttWaMuVvTiduZRnguLF7jNxTgiMBZ1hyAumKUiL2KRL",
    "3AVi9Tg9Uo68tJfuvoKvqKNWKkC5wPdSSdeBnizKZ6jT",
};

/// @brief Lamports в одном SOL (значения tip stream приходят в SOL)
inline constexpr double LAMPORTS_PER_SOL = 1e9;

// =============================================================================
// Значения по умолчанию
// =============================================================================

/// @brief URL ledger RPC по умолчанию
inline constexpr std::string_view DEFAULT_RPC_URL = "https://api.mainnet-beta.solana.com";

/// @brief URL relay по умолчанию
inline constexpr std::string_view DEFAULT_RELAY_URL = "https://ny.mainnet.block-engine.jito.wtf/api/v1/bundles";

/// @brief URL tip stream по умолчанию
inline constexpr std::string_view DEFAULT_TIP_STREAM_URL = "ws://bundles-api-rest.jito.wtf/api/v1/bundles/tip_stream";

/// @brief Таймаут RPC запроса (секунды)
inline constexpr uint32_t DEFAULT_RPC_TIMEOUT = 30;

/// @brief Пауза перед переподключением tip stream (секунды)
inline constexpr uint32_t DEFAULT_TIP_RECONNECT_SECONDS = 5;

/// @brief Нижняя граница адаптивного tip (lamports)
inline constexpr uint64_t DEFAULT_ADAPTIVE_TIP_FLOOR = 30'000;

/// @brief Размер пакета ключей (пул и fixed режим)
inline constexpr std::size_t DEFAULT_BATCH_SIZE = 25;

/// @brief Максимум bus на цикл
inline constexpr std::size_t DEFAULT_MAX_BUSES = 2;

/// @brief Потоков решателя
inline constexpr uint32_t DEFAULT_SOLVER_THREADS = 4;

/// @brief Одновременно решающих воркеров (fixed режим)
inline constexpr uint32_t DEFAULT_CONCURRENCY = 1;

/// @brief Максимум пакетов, забираемых из пула за раз
inline constexpr std::size_t DEFAULT_MAX_DRAIN = 4;

/// @brief Запас bus для fixed режима (required = rate * (n + 4))
inline constexpr uint64_t FIXED_BUS_HEADROOM = 4;

/// @brief Запас bus для pooled режима (required = rate * (n + 20))
inline constexpr uint64_t POOLED_BUS_HEADROOM = 20;

/// @brief Интервал опроса статусов подписей (мс)
inline constexpr uint32_t DEFAULT_POLL_INTERVAL_MS = 2000;

/// @brief Окно подтверждения в слотах
inline constexpr uint64_t DEFAULT_SLOT_EXPIRATION = 156;

/// @brief Пауза после ошибки RPC (мс)
inline constexpr uint32_t DEFAULT_ERROR_BACKOFF_MS = 500;

/// @brief Пауза при пустом пуле (мс)
inline constexpr uint32_t DEFAULT_IDLE_WAIT_MS = 500;

/// @brief Интервал отчёта о наградах (секунды)
inline constexpr uint32_t DEFAULT_REWARD_REPORT_INTERVAL = 600;

/// @brief Интервал повторной проверки claim в auto режиме (секунды)
inline constexpr uint32_t DEFAULT_CLAIM_RECHECK_INTERVAL = 300;

/// @brief Максимум ключей в одном getMultipleAccounts
inline constexpr std::size_t FETCH_ACCOUNT_LIMIT = 100;

/// @brief Имя бинарника CPU решателя
inline constexpr std::string_view DEFAULT_SOLVER_BINARY = "nonce-worker";

/// @brief Имя бинарника GPU решателя
inline constexpr std::string_view DEFAULT_GPU_SOLVER_BINARY = "nonce-worker-gpu";

} // namespace bundleminer::constants
