/**
 * @file resource_pool.hpp
 * @brief Пул пакетов ключей для pooled режима
 *
 * Пакеты хранятся в арене и адресуются индексом. Свободные индексы
 * лежат в ограниченной очереди. Каждый индекс в любой момент
 * принадлежит ровно одному владельцу: очереди, конвейеру решения или
 * наблюдателю подтверждения. Наблюдатель возвращает индекс через release().
 */

#pragma once

#include "identity.hpp"
#include "../core/types.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace bundleminer::mining {

/**
 * @brief Пакет ключей фиксированного размера
 */
struct IdentityBatch {
    std::size_t index = 0;
    std::vector<Identity> identities;
    std::vector<ledger::Pubkey> pubkeys;
    std::vector<ledger::Pubkey> proofs;
};

/**
 * @brief Арена пакетов и очередь свободных индексов
 */
class ResourcePool {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @brief Разбить ключи на пакеты
     *
     * @return Пул (все пакеты свободны) или MiningInvalidBatch, если
     *         количество ключей не кратно batch_size или равно нулю
     */
    [[nodiscard]] static Result<std::unique_ptr<ResourcePool>> create(
        std::vector<Identity> identities,
        std::size_t batch_size
    );

    /// @brief Только для create(); пакеты уже проверены
    ResourcePool(PrivateTag, std::vector<IdentityBatch> batches, std::size_t batch_size);

    // Запрещаем копирование
    ResourcePool(const ResourcePool&) = delete;
    ResourcePool& operator=(const ResourcePool&) = delete;

    /**
     * @brief Забрать до max_count свободных индексов без ожидания
     *
     * @return Индексы в порядке очереди (пусто, если свободных нет)
     */
    [[nodiscard]] std::vector<std::size_t> drain(std::size_t max_count);

    /**
     * @brief Вернуть индекс в очередь
     *
     * Повторный возврат уже свободного индекса игнорируется с ошибкой в логе.
     */
    void release(std::size_t index);

    [[nodiscard]] const IdentityBatch& batch(std::size_t index) const { return batches_.at(index); }
    [[nodiscard]] std::size_t batch_count() const noexcept { return batches_.size(); }
    [[nodiscard]] std::size_t batch_size() const noexcept { return batch_size_; }

    /// @brief Количество свободных пакетов
    [[nodiscard]] std::size_t idle_batches() const;

    /// @brief Количество ключей в свободных пакетах
    [[nodiscard]] std::size_t idle_identities() const { return idle_batches() * batch_size_; }

private:
    std::vector<IdentityBatch> batches_;
    std::size_t batch_size_;

    mutable std::mutex mutex_;
    std::deque<std::size_t> free_;
    std::vector<bool> queued_;
};

} // namespace bundleminer::mining
