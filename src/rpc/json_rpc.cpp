/**
 * @file json_rpc.cpp
 * @brief Реализация JSON-RPC клиента
 *
 * Использует libcurl для HTTP POST запросов и nlohmann/json для
 * сборки и разбора сообщений.
 */

#include "json_rpc.hpp"

#include <curl/curl.h>

#include <format>
#include <memory>

namespace bundleminer::rpc {

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, SlistDeleter>;

/**
 * @brief Callback для записи ответа
 */
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

ErrorCode map_rpc_error(int64_t code) noexcept {
    switch (code) {
        case -32601: return ErrorCode::RpcMethodNotFound;
        case -32602: return ErrorCode::RpcInvalidParams;
        case -32700: return ErrorCode::RpcParseError;
        default: return ErrorCode::RpcInternalError;
    }
}

} // namespace

JsonRpcClient::JsonRpcClient(std::string url, std::chrono::seconds timeout)
    : url_(std::move(url))
    , timeout_(timeout) {}

Result<nlohmann::json> JsonRpcClient::call(
    std::string_view method,
    nlohmann::json params
) const {
    CurlHandle curl{curl_easy_init()};
    if (!curl) {
        return Err<nlohmann::json>(ErrorCode::RpcConnectionFailed, "CURL не инициализирован");
    }

    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", next_id_.fetch_add(1, std::memory_order_relaxed)},
        {"method", method},
        {"params", std::move(params)},
    };
    const std::string body = request.dump();

    CurlHeaders headers{curl_slist_append(nullptr, "Content-Type: application/json")};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    std::string response;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return Err<nlohmann::json>(
            ErrorCode::RpcConnectionFailed,
            std::format("{}: CURL ошибка: {}", method, curl_easy_strerror(res))
        );
    }

    // Проверяем HTTP код
    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code == 401 || http_code == 403) {
        return Err<nlohmann::json>(ErrorCode::RpcAuthFailed, "Ошибка авторизации RPC");
    }

    nlohmann::json reply = nlohmann::json::parse(response, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        if (http_code != 200) {
            return Err<nlohmann::json>(
                ErrorCode::RpcInternalError,
                std::format("{}: HTTP ошибка: {}", method, http_code)
            );
        }
        return Err<nlohmann::json>(
            ErrorCode::RpcParseError,
            std::format("{}: ответ не является JSON", method)
        );
    }

    // Ошибка JSON-RPC может прийти и с HTTP 200, и с 4xx/5xx
    if (auto it = reply.find("error"); it != reply.end() && !it->is_null()) {
        const int64_t code = it->value("code", int64_t{0});
        const std::string message = it->value("message", std::string{"неизвестная ошибка"});
        return Err<nlohmann::json>(
            map_rpc_error(code),
            std::format("{}: RPC ошибка {}: {}", method, code, message)
        );
    }

    if (http_code != 200) {
        return Err<nlohmann::json>(
            ErrorCode::RpcInternalError,
            std::format("{}: HTTP ошибка: {}", method, http_code)
        );
    }

    auto result = reply.find("result");
    if (result == reply.end()) {
        return Err<nlohmann::json>(
            ErrorCode::RpcParseError,
            std::format("{}: в ответе нет поля result", method)
        );
    }
    return std::move(*result);
}

} // namespace bundleminer::rpc
