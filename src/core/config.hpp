/**
 * @file config.hpp
 * @brief Конфигурация bundleminer
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 *
 * Пример конфигурации (bundleminer.toml):
 * @code
 * [rpc]
 * url = "https://api.mainnet-beta.solana.com"
 * timeout_seconds = 30
 *
 * [relay]
 * url = "https://ny.mainnet.block-engine.jito.wtf/api/v1/bundles"
 *
 * [tip_feed]
 * url = "ws://bundles-api-rest.jito.wtf/api/v1/bundles/tip_stream"
 * reconnect_seconds = 5
 *
 * [mining]
 * key_folder = "./keys"
 * tip = 20000
 * max_adaptive_tip = 100000
 * max_buses = 2
 * threads = 4
 *
 * [claim]
 * beneficiary = "..."
 * threshold = 0.1
 *
 * [logging]
 * level = "info"
 * color = true
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace bundleminer {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки подключения к ledger RPC
 */
struct RpcConfig {
    /// @brief URL JSON-RPC сервера
    std::string url = std::string(constants::DEFAULT_RPC_URL);

    /// @brief Таймаут одного запроса (секунды)
    uint32_t timeout_seconds = constants::DEFAULT_RPC_TIMEOUT;
};

/**
 * @brief Настройки relay для отправки bundle
 */
struct RelayConfig {
    /// @brief URL метода sendBundle
    std::string url = std::string(constants::DEFAULT_RELAY_URL);

    /// @brief Таймаут запроса (секунды)
    uint32_t timeout_seconds = constants::DEFAULT_RPC_TIMEOUT;
};

/**
 * @brief Настройки потока перцентилей tip
 */
struct TipFeedConfig {
    /// @brief URL WebSocket потока
    std::string url = std::string(constants::DEFAULT_TIP_STREAM_URL);

    /// @brief Пауза перед переподключением (секунды)
    uint32_t reconnect_seconds = constants::DEFAULT_TIP_RECONNECT_SECONDS;
};

/**
 * @brief Настройки майнинга
 */
struct MiningConfig {
    /// @brief Каталог с JSON файлами ключей
    std::string key_folder;

    /// @brief Базовый tip (lamports), обязателен
    uint64_t tip = 0;

    /// @brief Потолок адаптивного tip (0 - адаптивный tip выключен)
    uint64_t max_adaptive_tip = 0;

    /// @brief Нижняя граница адаптивного tip
    uint64_t adaptive_tip_floor = constants::DEFAULT_ADAPTIVE_TIP_FLOOR;

    /// @brief Максимум bus (bundle) на один пакет за цикл
    std::size_t max_buses = constants::DEFAULT_MAX_BUSES;

    /// @brief Количество потоков решателя
    uint32_t threads = constants::DEFAULT_SOLVER_THREADS;

    /// @brief Сколько воркеров одновременно решают (fixed режим)
    uint32_t concurrency = constants::DEFAULT_CONCURRENCY;

    /// @brief Размер пакета ключей
    std::size_t batch_size = constants::DEFAULT_BATCH_SIZE;

    /// @brief Максимум пакетов из пула за раз (pooled режим)
    std::size_t max_drain = constants::DEFAULT_MAX_DRAIN;

    /// @brief Путь к CPU решателю (пусто - рядом с исполняемым файлом)
    std::string solver_path;

    /// @brief Путь к GPU решателю (пусто - рядом с исполняемым файлом)
    std::string gpu_solver_path;

    /// @brief Интервал опроса статусов подписей (мс)
    uint32_t poll_interval_ms = constants::DEFAULT_POLL_INTERVAL_MS;

    /// @brief Окно подтверждения bundle в слотах
    uint64_t slot_expiration = constants::DEFAULT_SLOT_EXPIRATION;

    /// @brief Пауза после ошибки RPC (мс)
    uint32_t error_backoff_ms = constants::DEFAULT_ERROR_BACKOFF_MS;

    /// @brief Пауза при пустом пуле (мс)
    uint32_t idle_wait_ms = constants::DEFAULT_IDLE_WAIT_MS;

    /// @brief Интервал отчёта о наградах (секунды)
    uint32_t reward_report_interval = constants::DEFAULT_REWARD_REPORT_INTERVAL;
};

/**
 * @brief Настройки вывода наград
 */
struct ClaimConfig {
    /// @brief Адрес получателя (владелец token аккаунта)
    std::string beneficiary;

    /// @brief Минимальная сумма для claim в токенах
    double threshold = 0.0;

    /// @brief Повторять claim периодически
    bool auto_claim = false;

    /// @brief Интервал повторной проверки (секунды)
    uint32_t recheck_interval = constants::DEFAULT_CLAIM_RECHECK_INTERVAL;
};

/**
 * @brief Адреса программы майнинга
 */
struct ProgramConfig {
    std::string program_id = std::string(constants::DEFAULT_PROGRAM_ID);
    std::string mint_address = std::string(constants::DEFAULT_MINT_ADDRESS);
};

/**
 * @brief Настройки логирования
 */
struct LoggingConfig {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";

    /// @brief Включить ANSI цвета в терминале
    bool color = true;
};

// =============================================================================
// Главная структура конфигурации
// =============================================================================

/**
 * @brief Полная конфигурация bundleminer
 */
struct Config {
    RpcConfig rpc;
    RelayConfig relay;
    TipFeedConfig tip_feed;
    MiningConfig mining;
    ClaimConfig claim;
    ProgramConfig program;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из файла
     *
     * @param path Путь к TOML файлу
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Загрузить конфигурацию из TOML строки
     */
    [[nodiscard]] static Result<Config> parse(std::string_view content);

    /**
     * @brief Загрузить конфигурацию с поиском в стандартных путях
     *
     * Порядок поиска:
     * 1. Указанный путь (если есть)
     * 2. ./bundleminer.toml
     * 3. /etc/bundleminer/bundleminer.toml
     * 4. ~/.config/bundleminer/bundleminer.toml
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Проверить корректность общих настроек
     *
     * Проверяет URL, лимиты bundle и интервалы. Требования конкретных
     * команд (tip, beneficiary) проверяются в validate_for_mining и
     * validate_for_claim.
     */
    [[nodiscard]] Result<void> validate() const;

    /// @brief Проверки для команд майнинга (tip обязателен)
    [[nodiscard]] Result<void> validate_for_mining() const;

    /// @brief Проверки для команды claim
    [[nodiscard]] Result<void> validate_for_claim() const;
};

} // namespace bundleminer
