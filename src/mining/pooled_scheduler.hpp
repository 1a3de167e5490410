/**
 * @file pooled_scheduler.hpp
 * @brief Режим пула пакетов (bundle-mine-pooled)
 *
 * Планировщик забирает из пула до max_drain свободных пакетов, решает их
 * одним вызовом решателя и передаёт отправку фоновой задаче. Для каждого
 * пакета, принятого relay, запускается наблюдатель, который по итогу
 * возвращает пакет в пул. Пока пакеты ждут подтверждения, планировщик
 * продолжает решать остальные.
 */

#pragma once

#include "bundle_builder.hpp"
#include "mining_context.hpp"
#include "resource_pool.hpp"
#include "submission_watcher.hpp"
#include "../core/task_group.hpp"

#include <optional>
#include <span>
#include <stop_token>
#include <vector>

namespace bundleminer::mining {

/**
 * @brief Решённая группа пакетов, готовая к отправке
 */
struct PreparedGroup {
    std::vector<std::size_t> indices;
    std::vector<ledger::Bus> buses;
    rpc::BalanceMap balances;
    /// @brief Решения всех ключей группы подряд, пакет за пакетом
    std::vector<SolveResult> results;
    /// @brief Ожидаемая награда одного пакета
    uint64_t batch_reward = 0;
    uint64_t slot = 0;
    Hash256 blockhash{};
    double solve_seconds = 0.0;
};

/**
 * @brief Планировщик pooled режима
 */
class PooledScheduler {
public:
    /**
     * @param context Общие сервисы
     * @param pool Пул пакетов
     * @param tasks Группа для задач отправки и наблюдения
     */
    PooledScheduler(const MiningContext& context, ResourcePool& pool, TaskGroup& tasks);

    // Запрещаем копирование
    PooledScheduler(const PooledScheduler&) = delete;
    PooledScheduler& operator=(const PooledScheduler&) = delete;

    /// @brief Работать до остановки
    void run(std::stop_token stop);

    /**
     * @brief Одна итерация: забрать пакеты, решить, передать отправку
     *
     * @return Количество обработанных пакетов (0 если пул пуст)
     */
    std::size_t run_once(std::stop_token stop);

private:
    /**
     * @brief Подготовить группу к отправке
     *
     * @return Группа или std::nullopt, если её нужно повторить
     */
    [[nodiscard]] std::optional<PreparedGroup> prepare(
        std::stop_token stop,
        std::span<const std::size_t> indices
    );

    /// @brief Отправить все пакеты группы (выполняется в фоновой задаче)
    void send_group(std::stop_token stop, const PreparedGroup& group);

    /// @brief Наблюдать за пакетом и вернуть его в пул
    void watch_batch(std::stop_token stop, std::size_t index, const SubmissionRecord& record);

    const MiningContext& context_;
    ResourcePool& pool_;
    TaskGroup& tasks_;
    BundleBuilder builder_;
    SubmissionWatcher watcher_;
};

} // namespace bundleminer::mining
