/**
 * @file json_rpc.hpp
 * @brief HTTP клиент JSON-RPC 2.0
 *
 * Используется для ledger RPC и для relay (метод sendBundle).
 * Каждый вызов создаёт отдельный CURL handle, поэтому клиент
 * можно вызывать из нескольких потоков одновременно.
 */

#pragma once

#include "../core/types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <string_view>

namespace bundleminer::rpc {

/**
 * @brief Клиент JSON-RPC поверх libcurl
 */
class JsonRpcClient {
public:
    /**
     * @brief Создать клиент
     *
     * @param url URL сервера
     * @param timeout Таймаут одного запроса
     */
    JsonRpcClient(std::string url, std::chrono::seconds timeout);

    // Запрещаем копирование
    JsonRpcClient(const JsonRpcClient&) = delete;
    JsonRpcClient& operator=(const JsonRpcClient&) = delete;

    /**
     * @brief Выполнить вызов
     *
     * @param method Имя метода
     * @param params Параметры (JSON массив)
     * @return Result<json> Поле "result" ответа или ошибка
     *
     * Ошибки:
     * - RpcConnectionFailed: сетевая ошибка или таймаут
     * - RpcAuthFailed: HTTP 401/403
     * - RpcInternalError: HTTP код != 200 или поле "error" в ответе
     * - RpcParseError: ответ не является JSON-RPC
     */
    [[nodiscard]] Result<nlohmann::json> call(
        std::string_view method,
        nlohmann::json params
    ) const;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

private:
    std::string url_;
    std::chrono::seconds timeout_;
    mutable std::atomic<uint64_t> next_id_{1};
};

} // namespace bundleminer::rpc
