/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <vector>

namespace bundleminer {

namespace {

/// @brief Разобрать таблицу TOML в структуру Config
Config from_table(const toml::table& table) {
    Config config;

    // === Секция [rpc] ===
    if (auto rpc = table["rpc"].as_table()) {
        if (auto val = (*rpc)["url"].value<std::string>()) {
            config.rpc.url = *val;
        }
        if (auto val = (*rpc)["timeout_seconds"].value<int64_t>()) {
            config.rpc.timeout_seconds = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [relay] ===
    if (auto relay = table["relay"].as_table()) {
        if (auto val = (*relay)["url"].value<std::string>()) {
            config.relay.url = *val;
        }
        if (auto val = (*relay)["timeout_seconds"].value<int64_t>()) {
            config.relay.timeout_seconds = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [tip_feed] ===
    if (auto feed = table["tip_feed"].as_table()) {
        if (auto val = (*feed)["url"].value<std::string>()) {
            config.tip_feed.url = *val;
        }
        if (auto val = (*feed)["reconnect_seconds"].value<int64_t>()) {
            config.tip_feed.reconnect_seconds = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [mining] ===
    if (auto mining = table["mining"].as_table()) {
        if (auto val = (*mining)["key_folder"].value<std::string>()) {
            config.mining.key_folder = *val;
        }
        if (auto val = (*mining)["tip"].value<int64_t>()) {
            config.mining.tip = static_cast<uint64_t>(*val);
        }
        if (auto val = (*mining)["max_adaptive_tip"].value<int64_t>()) {
            config.mining.max_adaptive_tip = static_cast<uint64_t>(*val);
        }
        if (auto val = (*mining)["adaptive_tip_floor"].value<int64_t>()) {
            config.mining.adaptive_tip_floor = static_cast<uint64_t>(*val);
        }
        if (auto val = (*mining)["max_buses"].value<int64_t>()) {
            config.mining.max_buses = static_cast<std::size_t>(*val);
        }
        if (auto val = (*mining)["threads"].value<int64_t>()) {
            config.mining.threads = static_cast<uint32_t>(*val);
        }
        if (auto val = (*mining)["concurrency"].value<int64_t>()) {
            config.mining.concurrency = static_cast<uint32_t>(*val);
        }
        if (auto val = (*mining)["batch_size"].value<int64_t>()) {
            config.mining.batch_size = static_cast<std::size_t>(*val);
        }
        if (auto val = (*mining)["max_drain"].value<int64_t>()) {
            config.mining.max_drain = static_cast<std::size_t>(*val);
        }
        if (auto val = (*mining)["solver_path"].value<std::string>()) {
            config.mining.solver_path = *val;
        }
        if (auto val = (*mining)["gpu_solver_path"].value<std::string>()) {
            config.mining.gpu_solver_path = *val;
        }
        if (auto val = (*mining)["poll_interval_ms"].value<int64_t>()) {
            config.mining.poll_interval_ms = static_cast<uint32_t>(*val);
        }
        if (auto val = (*mining)["slot_expiration"].value<int64_t>()) {
            config.mining.slot_expiration = static_cast<uint64_t>(*val);
        }
        if (auto val = (*mining)["error_backoff_ms"].value<int64_t>()) {
            config.mining.error_backoff_ms = static_cast<uint32_t>(*val);
        }
        if (auto val = (*mining)["idle_wait_ms"].value<int64_t>()) {
            config.mining.idle_wait_ms = static_cast<uint32_t>(*val);
        }
        if (auto val = (*mining)["reward_report_interval"].value<int64_t>()) {
            config.mining.reward_report_interval = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [claim] ===
    if (auto claim = table["claim"].as_table()) {
        if (auto val = (*claim)["beneficiary"].value<std::string>()) {
            config.claim.beneficiary = *val;
        }
        // threshold допускает как целое, так и дробное значение
        if (auto val = (*claim)["threshold"].value<double>()) {
            config.claim.threshold = *val;
        }
        if (auto val = (*claim)["auto"].value<bool>()) {
            config.claim.auto_claim = *val;
        }
        if (auto val = (*claim)["recheck_interval"].value<int64_t>()) {
            config.claim.recheck_interval = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [program] ===
    if (auto program = table["program"].as_table()) {
        if (auto val = (*program)["program_id"].value<std::string>()) {
            config.program.program_id = *val;
        }
        if (auto val = (*program)["mint_address"].value<std::string>()) {
            config.program.mint_address = *val;
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
    }

    return config;
}

} // namespace

// =============================================================================
// Config - Загрузка из файла
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view content) {
    try {
        auto table = toml::parse(content);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный путь должен существовать
    if (path.has_value()) {
        return load(path.value());
    }

    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("bundleminer.toml");
    search_paths.push_back("/etc/bundleminer/bundleminer.toml");

    // Домашняя директория пользователя
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "bundleminer" / "bundleminer.toml"
        );
    }

    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (rpc.url.empty()) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Не указан rpc.url");
    }

    if (relay.url.empty()) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Не указан relay.url");
    }

    if (!tip_feed.url.starts_with("ws://") && !tip_feed.url.starts_with("wss://")) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "tip_feed.url должен начинаться с ws:// или wss://"
        );
    }

    // Лимиты relay: не больше 25 ключей в bundle
    if (mining.batch_size == 0 ||
        mining.batch_size > constants::MAX_IDENTITIES_PER_BUNDLE) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("mining.batch_size должен быть от 1 до {}",
                        constants::MAX_IDENTITIES_PER_BUNDLE)
        );
    }

    if (mining.max_buses == 0 || mining.max_buses > constants::BUS_COUNT) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("mining.max_buses должен быть от 1 до {}", constants::BUS_COUNT)
        );
    }

    if (mining.threads == 0 || mining.threads > 255) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "mining.threads должен быть от 1 до 255"
        );
    }

    if (mining.concurrency == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "mining.concurrency не может быть 0");
    }

    if (mining.max_drain == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "mining.max_drain не может быть 0");
    }

    if (mining.poll_interval_ms == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "mining.poll_interval_ms не может быть 0");
    }

    if (mining.slot_expiration == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "mining.slot_expiration не может быть 0");
    }

    if (logging.level != "error" && logging.level != "warn" &&
        logging.level != "info" && logging.level != "debug") {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "logging.level должен быть 'error', 'warn', 'info' или 'debug'"
        );
    }

    return {};
}

Result<void> Config::validate_for_mining() const {
    if (mining.tip == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Не указан tip (mining.tip). Без tip relay не примет bundle"
        );
    }

    if (mining.key_folder.empty()) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Не указан mining.key_folder");
    }

    return {};
}

Result<void> Config::validate_for_claim() const {
    if (auto result = validate_for_mining(); !result) {
        return result;
    }

    if (claim.beneficiary.empty()) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Не указан claim.beneficiary");
    }

    if (claim.threshold < 0.0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "claim.threshold не может быть отрицательным");
    }

    return {};
}

} // namespace bundleminer
