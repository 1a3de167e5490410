/**
 * @file submission_watcher.hpp
 * @brief Отслеживание подтверждения отправленных bundle
 *
 * Машина состояний: Sent -> {Landed, Dropped}.
 *
 * Каждый интервал опроса запрашиваются статусы всех подписей записи.
 * Любая подпись в состоянии confirmed/finalized без ошибки - Landed.
 * Если последний наблюдаемый слот достиг sent_at_slot + slot_expiration
 * без подтверждения - Dropped. Ошибка запроса логируется, после паузы
 * опрос повторяется без ограничения числа попыток.
 */

#pragma once

#include "../core/types.hpp"
#include "../ledger/pubkey.hpp"
#include "../rpc/ledger_service.hpp"
#include "../tips/tip_feed.hpp"

#include <chrono>
#include <optional>
#include <stop_token>
#include <string_view>
#include <vector>

namespace bundleminer::mining {

/**
 * @brief Итог отслеживания
 */
enum class Outcome {
    Landed,
    Dropped
};

[[nodiscard]] constexpr std::string_view to_string(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::Landed:  return "landed";
        case Outcome::Dropped: return "dropped";
        default: return "unknown";
    }
}

/**
 * @brief Запись об отправке (живёт до Landed/Dropped)
 */
struct SubmissionRecord {
    /// @brief Подписи отслеживания, по одной на принятый bundle
    std::vector<ledger::Signature> signatures;
    /// @brief Слот blockhash, с которым подписаны транзакции
    uint64_t sent_at_slot = 0;
    /// @brief Ожидаемая награда при подтверждении
    uint64_t reward_estimate = 0;
    /// @brief tip за bundle
    uint64_t tip_paid = 0;
    std::chrono::steady_clock::time_point sent_at = std::chrono::steady_clock::now();
};

/**
 * @brief Результат отслеживания
 */
struct WatchResult {
    Outcome outcome = Outcome::Dropped;
    /// @brief Первая подтверждённая подпись (только для Landed)
    std::optional<ledger::Signature> landed_signature;
    /// @brief Последний наблюдаемый слот
    uint64_t last_slot = 0;
    /// @brief Количество выполненных запросов статусов
    std::size_t polls = 0;
    std::chrono::steady_clock::duration elapsed{};
};

/**
 * @brief Наблюдатель подтверждения
 */
class SubmissionWatcher {
public:
    /**
     * @param ledger Доступ к статусам подписей
     * @param poll_interval Интервал опроса
     * @param slot_expiration Окно подтверждения в слотах
     */
    SubmissionWatcher(
        rpc::LedgerService& ledger,
        std::chrono::milliseconds poll_interval,
        uint64_t slot_expiration
    );

    /**
     * @brief Отслеживать запись до подтверждения или истечения окна
     *
     * Запрос остановки завершает отслеживание с Dropped.
     */
    [[nodiscard]] WatchResult watch(std::stop_token stop, const SubmissionRecord& record) const;

private:
    rpc::LedgerService& ledger_;
    std::chrono::milliseconds poll_interval_;
    uint64_t slot_expiration_;
};

/**
 * @brief Залогировать итог и обновить метрики
 *
 * Landed: награда записи добавляется в счётчик наград.
 * Dropped: предупреждение с текущими перцентилями tip.
 *
 * @param label Контекст для лога (номер воркера или пакета)
 */
void record_outcome(
    std::string_view label,
    const SubmissionRecord& record,
    const WatchResult& result,
    const tips::TipSnapshot& tips
);

} // namespace bundleminer::mining
