/**
 * @file types.hpp
 * @brief Базовые типы для bundleminer
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный хеш (challenge, difficulty, результат решателя)
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bundleminer {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Используется для:
 * - challenge из Proof аккаунта
 * - difficulty из Treasury аккаунта
 * - хеша, найденного внешним решателем
 * - recent blockhash
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Динамический массив байт
 *
 * Используется для сериализации транзакций и данных аккаунтов.
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

/**
 * @brief Изменяемое представление на массив байт
 */
using MutableByteSpan = std::span<uint8_t>;

// =============================================================================
// Коды ошибок bundleminer
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Ошибки возвращаются через Result<T>, исключения не пересекают
 * границы модулей.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки сети (200-299)
    NetworkConnectionFailed = 200,
    NetworkTimeout = 201,
    NetworkSendFailed = 202,
    NetworkRecvFailed = 203,

    // Ошибки RPC (300-399)
    RpcConnectionFailed = 300,
    RpcAuthFailed = 301,
    RpcParseError = 302,
    RpcMethodNotFound = 303,
    RpcInvalidParams = 304,
    RpcInternalError = 305,
    RpcAccountNotFound = 306,

    // Ошибки relay (400-499)
    RelayRejected = 400,
    RelayParseError = 401,

    // Ошибки майнинга (500-599)
    MiningNoIdentities = 500,
    MiningInvalidBatch = 501,
    MiningSolverFailed = 502,
    MiningEpochExpired = 503,
    FeePayerNoCandidates = 504,
    FeePayerBalanceMissing = 505,
    SimulationRejected = 506,

    // Ошибки леджера (600-699)
    LedgerInvalidAddress = 600,
    LedgerInvalidAccount = 601,
    LedgerInvalidTransaction = 602,
    LedgerNoProgramAddress = 603,

    // Криптографические ошибки (700-799)
    CryptoHashError = 700,
    CryptoInvalidLength = 701,
    CryptoInvalidKey = 702,
    CryptoSignFailed = 703,

    // Системные ошибки (800-899)
    SystemOutOfMemory = 800,
    SystemIOError = 801,
    SystemProcessFailed = 802,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::NetworkConnectionFailed: return "Ошибка подключения к сети";
        case ErrorCode::NetworkTimeout: return "Таймаут сети";
        case ErrorCode::NetworkSendFailed: return "Ошибка отправки данных";
        case ErrorCode::NetworkRecvFailed: return "Ошибка получения данных";
        case ErrorCode::RpcConnectionFailed: return "Ошибка подключения к RPC";
        case ErrorCode::RpcAuthFailed: return "Ошибка авторизации RPC";
        case ErrorCode::RpcParseError: return "Ошибка парсинга ответа RPC";
        case ErrorCode::RpcMethodNotFound: return "RPC метод не найден";
        case ErrorCode::RpcInvalidParams: return "Некорректные параметры RPC";
        case ErrorCode::RpcInternalError: return "Внутренняя ошибка RPC";
        case ErrorCode::RpcAccountNotFound: return "Аккаунт не найден";
        case ErrorCode::RelayRejected: return "Relay отклонил bundle";
        case ErrorCode::RelayParseError: return "Ошибка парсинга ответа relay";
        case ErrorCode::MiningNoIdentities: return "Нет ключей для майнинга";
        case ErrorCode::MiningInvalidBatch: return "Некорректный пакет ключей";
        case ErrorCode::MiningSolverFailed: return "Ошибка решателя";
        case ErrorCode::MiningEpochExpired: return "Эпоха истекла во время решения";
        case ErrorCode::FeePayerNoCandidates: return "Нет кандидатов на оплату комиссии";
        case ErrorCode::FeePayerBalanceMissing: return "Баланс кандидата неизвестен";
        case ErrorCode::SimulationRejected: return "Симуляция транзакции отклонена";
        case ErrorCode::LedgerInvalidAddress: return "Некорректный адрес";
        case ErrorCode::LedgerInvalidAccount: return "Некорректные данные аккаунта";
        case ErrorCode::LedgerInvalidTransaction: return "Некорректная транзакция";
        case ErrorCode::LedgerNoProgramAddress: return "Не найден program address";
        case ErrorCode::CryptoHashError: return "Ошибка хеширования";
        case ErrorCode::CryptoInvalidLength: return "Некорректная длина данных";
        case ErrorCode::CryptoInvalidKey: return "Некорректный ключ";
        case ErrorCode::CryptoSignFailed: return "Ошибка подписи";
        case ErrorCode::SystemOutOfMemory: return "Недостаточно памяти";
        case ErrorCode::SystemIOError: return "Ошибка ввода/вывода";
        case ErrorCode::SystemProcessFailed: return "Ошибка дочернего процесса";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    constexpr explicit Error(ErrorCode c) noexcept
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @tparam T Тип возвращаемого значения
 *
 * Пример использования:
 * @code
 * Result<uint64_t> balance = ledger.get_balance(address);
 * if (!balance) {
 *     log::error("{}", balance.error().message);
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать успешный результат
 */
template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T&& value) {
    return Result<T>(std::forward<T>(value));
}

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] constexpr Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Concepts для type constraints
// =============================================================================

/**
 * @brief Concept для байтовых контейнеров
 */
template<typename T>
concept ByteContainer = requires(T t) {
    { t.data() } -> std::convertible_to<const uint8_t*>;
    { t.size() } -> std::convertible_to<std::size_t>;
};

} // namespace bundleminer
