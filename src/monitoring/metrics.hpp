/**
 * @file metrics.hpp
 * @brief Метрики майнинга bundle
 *
 * Централизованный сбор метрик с потокобезопасным доступом.
 * Поддерживает counters, gauges и histograms.
 */

#pragma once

#include "../core/types.hpp"

#include <atomic>
#include <chrono>
#include <limits>
#include <string>
#include <vector>

namespace bundleminer::monitoring {

// =============================================================================
// Histogram Buckets
// =============================================================================

/**
 * @brief Bucket для histogram
 */
struct HistogramBucket {
    double le;           ///< Upper bound (less than or equal)
    std::atomic<uint64_t> count{0};

    explicit HistogramBucket(double upper_bound) : le(upper_bound) {}

    // Конструктор копирования для atomic
    HistogramBucket(const HistogramBucket& other)
        : le(other.le), count(other.count.load()) {}

    HistogramBucket& operator=(const HistogramBucket& other) {
        if (this != &other) {
            le = other.le;
            count.store(other.count.load());
        }
        return *this;
    }
};

/**
 * @brief Histogram метрика
 */
struct Histogram {
    std::vector<HistogramBucket> buckets;
    std::atomic<double> sum{0.0};
    std::atomic<uint64_t> count{0};

    Histogram() = default;

    Histogram(const Histogram& other)
        : buckets(other.buckets)
        , sum(other.sum.load())
        , count(other.count.load()) {}

    Histogram& operator=(const Histogram& other) {
        if (this != &other) {
            buckets = other.buckets;
            sum.store(other.sum.load());
            count.store(other.count.load());
        }
        return *this;
    }

    /**
     * @brief Histogram для времени подтверждения bundle (секунды)
     *
     * Слот ~0.4 с, окно подтверждения ~60 с.
     */
    static Histogram create_confirmation_histogram() {
        Histogram h;
        h.buckets.emplace_back(2.0);
        h.buckets.emplace_back(4.0);
        h.buckets.emplace_back(8.0);
        h.buckets.emplace_back(16.0);
        h.buckets.emplace_back(32.0);
        h.buckets.emplace_back(64.0);
        h.buckets.emplace_back(std::numeric_limits<double>::infinity()); // +Inf
        return h;
    }

    /**
     * @brief Histogram для времени решения (секунды)
     */
    static Histogram create_solve_histogram() {
        Histogram h;
        h.buckets.emplace_back(5.0);
        h.buckets.emplace_back(10.0);
        h.buckets.emplace_back(20.0);
        h.buckets.emplace_back(30.0);
        h.buckets.emplace_back(45.0);
        h.buckets.emplace_back(60.0);
        h.buckets.emplace_back(std::numeric_limits<double>::infinity());
        return h;
    }

    /**
     * @brief Записать наблюдение
     */
    void observe(double value) {
        for (auto& bucket : buckets) {
            if (value <= bucket.le) {
                bucket.count++;
            }
        }

        double expected = sum.load();
        while (!sum.compare_exchange_weak(expected, expected + value)) {
        }

        count++;
    }

    /// @brief Среднее значение (0 без наблюдений)
    [[nodiscard]] double mean() const {
        const uint64_t n = count.load();
        return n == 0 ? 0.0 : sum.load() / static_cast<double>(n);
    }

    void clear() {
        for (auto& bucket : buckets) {
            bucket.count = 0;
        }
        sum = 0.0;
        count = 0;
    }
};

// =============================================================================
// Metrics Singleton
// =============================================================================

/**
 * @brief Централизованный сборщик метрик
 *
 * Singleton для потокобезопасного сбора метрик со всех компонентов.
 */
class Metrics {
public:
    /**
     * @brief Получить единственный экземпляр
     */
    static Metrics& instance();

    // Запрещаем копирование
    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    /**
     * @brief Получить uptime в секундах
     */
    [[nodiscard]] uint64_t get_uptime_seconds() const;

    // =========================================================================
    // Counters (только увеличение)
    // =========================================================================

    /// @brief Bundle принят relay
    void inc_bundles_sent();

    /// @brief Bundle подтверждён
    void inc_bundles_landed();

    /// @brief Bundle не подтверждён в окне слотов
    void inc_bundles_dropped();

    /// @brief Relay отклонил bundle
    void inc_relay_rejections();

    /// @brief Ошибка запроса к леджеру
    void inc_rpc_errors();

    /// @brief Транзакция отклонена симуляцией
    void inc_simulation_rejections();

    /// @brief Сумма tip в принятых relay bundle (lamports)
    void add_tips_paid(uint64_t lamports);

    /**
     * @brief Добавить подтверждённую награду
     *
     * Награда попадает и в общий счётчик, и в счётчик с момента
     * последнего отчёта (см. take_rewards).
     */
    void add_rewards(uint64_t amount);

    /**
     * @brief Забрать награду с момента последнего вызова
     *
     * Атомарно обнуляет счётчик отчёта.
     */
    [[nodiscard]] uint64_t take_rewards();

    // =========================================================================
    // Gauges (произвольное значение)
    // =========================================================================

    /// @brief Количество ключей в пуле, ожидающих работы
    void set_idle_identities(int64_t count);
    void add_idle_identities(int64_t delta);

    /// @brief Медиана принятых tip из потока
    void set_tip_p50(uint64_t lamports);

    // =========================================================================
    // Histograms
    // =========================================================================

    /// @brief Время от отправки до подтверждения (секунды)
    void observe_confirmation(double seconds);

    /// @brief Время работы решателя (секунды)
    void observe_solve(double seconds);

    // =========================================================================
    // Получение значений
    // =========================================================================

    [[nodiscard]] uint64_t get_bundles_sent() const;
    [[nodiscard]] uint64_t get_bundles_landed() const;
    [[nodiscard]] uint64_t get_bundles_dropped() const;
    [[nodiscard]] uint64_t get_relay_rejections() const;
    [[nodiscard]] uint64_t get_rpc_errors() const;
    [[nodiscard]] uint64_t get_simulation_rejections() const;
    [[nodiscard]] uint64_t get_tips_paid() const;
    [[nodiscard]] uint64_t get_rewards_total() const;
    [[nodiscard]] int64_t get_idle_identities() const;
    [[nodiscard]] uint64_t get_tip_p50() const;
    [[nodiscard]] uint64_t get_confirmation_count() const;
    [[nodiscard]] double get_confirmation_mean() const;

    // =========================================================================
    // Экспорт
    // =========================================================================

    /**
     * @brief Однострочная сводка для периодического отчёта
     *
     * Формат: `key=value` через пробел.
     */
    [[nodiscard]] std::string summary() const;

    /**
     * @brief Сбросить все метрики
     */
    void reset();

private:
    Metrics();
    ~Metrics() = default;

    std::chrono::steady_clock::time_point start_time_;

    // Counters
    std::atomic<uint64_t> bundles_sent_{0};
    std::atomic<uint64_t> bundles_landed_{0};
    std::atomic<uint64_t> bundles_dropped_{0};
    std::atomic<uint64_t> relay_rejections_{0};
    std::atomic<uint64_t> rpc_errors_{0};
    std::atomic<uint64_t> simulation_rejections_{0};
    std::atomic<uint64_t> tips_paid_{0};
    std::atomic<uint64_t> rewards_total_{0};
    std::atomic<uint64_t> rewards_pending_{0};

    // Gauges
    std::atomic<int64_t> idle_identities_{0};
    std::atomic<uint64_t> tip_p50_{0};

    // Histograms
    Histogram confirmation_histogram_;
    Histogram solve_histogram_;
};

} // namespace bundleminer::monitoring
