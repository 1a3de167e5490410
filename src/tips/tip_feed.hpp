/**
 * @file tip_feed.hpp
 * @brief Поток перцентилей tip, принятых relay
 *
 * Фоновый поток держит подписку на WebSocket поток relay и после каждого
 * сообщения атомарно подменяет неизменяемый снимок TipSnapshot.
 * Читатели получают копию снимка; устаревание на один интервал потока
 * допустимо.
 *
 * Ошибки подключения и разбора логируются, поток переподключается
 * бесконечно с фиксированной паузой.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace bundleminer::tips {

/**
 * @brief Перцентили принятых tip в lamports
 *
 * Все поля нулевые, пока не получено первое сообщение.
 */
struct TipSnapshot {
    uint64_t p25 = 0;
    uint64_t p50 = 0;
    uint64_t p75 = 0;
    uint64_t p95 = 0;
    uint64_t p99 = 0;

    auto operator<=>(const TipSnapshot&) const = default;
};

/**
 * @brief Разобрать сообщение потока
 *
 * Сообщение - JSON массив записей с полями
 * landed_tips_{25th,50th,75th,95th,99th}_percentile (в SOL).
 * Берётся первая запись.
 *
 * @return Снимок, std::nullopt для пустого массива, ошибка RpcParseError
 *         для некорректного JSON
 */
[[nodiscard]] Result<std::optional<TipSnapshot>> parse_tip_message(std::string_view message);

/**
 * @brief Вычислить tip с учётом рынка
 *
 * - cap == 0: адаптивный режим выключен, возвращается base
 * - p50 == 0: поток ещё не прогрет, возвращается base
 * - иначе min(cap, max(floor, p50 + 1))
 */
[[nodiscard]] constexpr uint64_t adaptive_tip(
    uint64_t base,
    uint64_t cap,
    const TipSnapshot& snapshot,
    uint64_t floor
) noexcept {
    if (cap == 0 || snapshot.p50 == 0) {
        return base;
    }
    const uint64_t bid = snapshot.p50 + 1;
    const uint64_t floored = bid > floor ? bid : floor;
    return floored < cap ? floored : cap;
}

/**
 * @brief Источник сообщений потока
 */
class TipStream {
public:
    using MessageHandler = std::function<void(std::string_view)>;

    virtual ~TipStream() = default;

    /**
     * @brief Подключиться и читать сообщения до разрыва или остановки
     *
     * @return {} при штатном разрыве или остановке, ошибка при сбое
     *         подключения или чтения
     */
    [[nodiscard]] virtual Result<void> run(
        std::stop_token stop,
        const MessageHandler& on_message
    ) = 0;
};

/**
 * @brief WebSocket поток через libcurl (CURLOPT_CONNECT_ONLY = 2)
 */
class WebSocketTipStream final : public TipStream {
public:
    explicit WebSocketTipStream(std::string url);

    [[nodiscard]] Result<void> run(
        std::stop_token stop,
        const MessageHandler& on_message
    ) override;

private:
    std::string url_;
};

/**
 * @brief Владелец текущего снимка tip
 */
class TipFeed {
public:
    /**
     * @param stream Источник сообщений
     * @param reconnect_backoff Пауза перед переподключением
     */
    TipFeed(std::unique_ptr<TipStream> stream, std::chrono::milliseconds reconnect_backoff);
    ~TipFeed();

    // Запрещаем копирование
    TipFeed(const TipFeed&) = delete;
    TipFeed& operator=(const TipFeed&) = delete;

    /// @brief Запустить фоновый поток подписки
    void start();

    /// @brief Остановить поток и дождаться его завершения
    void stop();

    /// @brief Копия текущего снимка
    [[nodiscard]] TipSnapshot snapshot() const;

    /// @brief Заменить снимок
    void publish(const TipSnapshot& snapshot);

    /// @brief Обработать одно сообщение потока
    void handle_message(std::string_view message);

    /// @brief Количество подключений (включая первое)
    [[nodiscard]] uint64_t connection_attempts() const noexcept {
        return connection_attempts_.load(std::memory_order_relaxed);
    }

private:
    void run_loop(std::stop_token stop);

    std::unique_ptr<TipStream> stream_;
    std::chrono::milliseconds reconnect_backoff_;

    mutable std::shared_mutex mutex_;
    std::shared_ptr<const TipSnapshot> current_;

    std::atomic<uint64_t> connection_attempts_{0};
    std::jthread thread_;
};

} // namespace bundleminer::tips
