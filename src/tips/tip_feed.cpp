/**
 * @file tip_feed.cpp
 * @brief Реализация подписки на поток перцентилей tip
 */

#include "tip_feed.hpp"
#include "../core/constants.hpp"
#include "../core/task_group.hpp"
#include "../log/logger.hpp"
#include "../monitoring/metrics.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <poll.h>

#include <cerrno>
#include <cmath>
#include <format>

namespace bundleminer::tips {

namespace {

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

/// @brief Таймаут poll() между проверками остановки
constexpr int POLL_TIMEOUT_MS = 250;

uint64_t to_lamports(const nlohmann::json& record, const char* field) {
    const double value = record.value(field, 0.0);
    if (value <= 0.0) {
        return 0;
    }
    return static_cast<uint64_t>(std::llround(value * constants::LAMPORTS_PER_SOL));
}

} // namespace

// =============================================================================
// Разбор сообщений
// =============================================================================

Result<std::optional<TipSnapshot>> parse_tip_message(std::string_view message) {
    auto json = nlohmann::json::parse(message, nullptr, false);
    if (json.is_discarded() || !json.is_array()) {
        return Err<std::optional<TipSnapshot>>(
            ErrorCode::RpcParseError,
            "Сообщение tip stream не является JSON массивом"
        );
    }
    if (json.empty()) {
        return std::optional<TipSnapshot>{};
    }

    const auto& record = json.front();
    if (!record.is_object()) {
        return Err<std::optional<TipSnapshot>>(
            ErrorCode::RpcParseError,
            "Запись tip stream не является объектом"
        );
    }

    try {
        TipSnapshot snapshot;
        snapshot.p25 = to_lamports(record, "landed_tips_25th_percentile");
        snapshot.p50 = to_lamports(record, "landed_tips_50th_percentile");
        snapshot.p75 = to_lamports(record, "landed_tips_75th_percentile");
        snapshot.p95 = to_lamports(record, "landed_tips_95th_percentile");
        snapshot.p99 = to_lamports(record, "landed_tips_99th_percentile");
        return std::optional<TipSnapshot>{snapshot};
    } catch (const nlohmann::json::exception& e) {
        return Err<std::optional<TipSnapshot>>(
            ErrorCode::RpcParseError,
            std::format("Некорректная запись tip stream: {}", e.what())
        );
    }
}

// =============================================================================
// WebSocketTipStream
// =============================================================================

WebSocketTipStream::WebSocketTipStream(std::string url)
    : url_(std::move(url)) {}

Result<void> WebSocketTipStream::run(
    std::stop_token stop,
    const MessageHandler& on_message
) {
    CurlHandle curl{curl_easy_init()};
    if (!curl) {
        return Err<void>(ErrorCode::NetworkConnectionFailed, "CURL не инициализирован");
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECT_ONLY, 2L);  // WebSocket
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return Err<void>(
            ErrorCode::NetworkConnectionFailed,
            std::format("Ошибка подключения к {}: {}", url_, curl_easy_strerror(res))
        );
    }

    curl_socket_t socket = CURL_SOCKET_BAD;
    curl_easy_getinfo(curl.get(), CURLINFO_ACTIVESOCKET, &socket);
    if (socket == CURL_SOCKET_BAD) {
        return Err<void>(ErrorCode::NetworkConnectionFailed, "Нет активного сокета");
    }

    log::info("Подключено к tip stream {}", url_);

    std::string message;
    char buffer[4096];

    while (!stop.stop_requested()) {
        size_t received = 0;
        const struct curl_ws_frame* meta = nullptr;
        res = curl_ws_recv(curl.get(), buffer, sizeof(buffer), &received, &meta);

        if (res == CURLE_AGAIN) {
            pollfd pfd{};
            pfd.fd = socket;
            pfd.events = POLLIN;
            const int ready = ::poll(&pfd, 1, POLL_TIMEOUT_MS);
            if (ready < 0 && errno != EINTR) {
                return Err<void>(ErrorCode::NetworkRecvFailed, "Ошибка poll() на сокете tip stream");
            }
            continue;
        }

        if (res == CURLE_GOT_NOTHING) {
            // Соединение закрыто сервером
            return {};
        }

        if (res != CURLE_OK) {
            return Err<void>(
                ErrorCode::NetworkRecvFailed,
                std::format("Ошибка чтения tip stream: {}", curl_easy_strerror(res))
            );
        }

        if (meta == nullptr) {
            continue;
        }

        if (meta->flags & CURLWS_CLOSE) {
            return {};
        }

        if (!(meta->flags & (CURLWS_TEXT | CURLWS_BINARY | CURLWS_CONT))) {
            // PING/PONG - libcurl отвечает сам
            continue;
        }

        message.append(buffer, received);

        // Сообщение завершено, если нет хвоста фрейма и это не фрагмент
        if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
            on_message(message);
            message.clear();
        }
    }

    return {};
}

// =============================================================================
// TipFeed
// =============================================================================

TipFeed::TipFeed(std::unique_ptr<TipStream> stream, std::chrono::milliseconds reconnect_backoff)
    : stream_(std::move(stream))
    , reconnect_backoff_(reconnect_backoff)
    , current_(std::make_shared<const TipSnapshot>()) {}

TipFeed::~TipFeed() {
    stop();
}

void TipFeed::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::jthread([this](std::stop_token stop) { run_loop(stop); });
}

void TipFeed::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

TipSnapshot TipFeed::snapshot() const {
    std::shared_lock lock(mutex_);
    return *current_;
}

void TipFeed::publish(const TipSnapshot& snapshot) {
    auto next = std::make_shared<const TipSnapshot>(snapshot);
    {
        std::unique_lock lock(mutex_);
        current_.swap(next);
    }
    monitoring::Metrics::instance().set_tip_p50(snapshot.p50);
}

void TipFeed::handle_message(std::string_view message) {
    auto parsed = parse_tip_message(message);
    if (!parsed) {
        log::error("{}", parsed.error().message);
        return;
    }
    if (!parsed->has_value()) {
        log::debug("Пустое сообщение tip stream");
        return;
    }
    publish(**parsed);
    log::debug("tip p25={} p50={} p75={}", (*parsed)->p25, (*parsed)->p50, (*parsed)->p75);
}

void TipFeed::run_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        connection_attempts_.fetch_add(1, std::memory_order_relaxed);

        auto result = stream_->run(stop, [this](std::string_view message) {
            handle_message(message);
        });

        if (stop.stop_requested()) {
            break;
        }

        if (!result) {
            log::error("Ошибка tip stream: {}", result.error().message);
        }
        log::info("tip stream отключён, переподключение через {} мс", reconnect_backoff_.count());

        if (!sleep_for(stop, reconnect_backoff_)) {
            break;
        }
    }
}

} // namespace bundleminer::tips
