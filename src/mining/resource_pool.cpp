/**
 * @file resource_pool.cpp
 * @brief Реализация пула пакетов ключей
 */

#include "resource_pool.hpp"
#include "../log/logger.hpp"
#include "../monitoring/metrics.hpp"

#include <format>

namespace bundleminer::mining {

Result<std::unique_ptr<ResourcePool>> ResourcePool::create(
    std::vector<Identity> identities,
    std::size_t batch_size
) {
    if (batch_size == 0 || identities.empty() || identities.size() % batch_size != 0) {
        return Err<std::unique_ptr<ResourcePool>>(
            ErrorCode::MiningInvalidBatch,
            std::format("Количество ключей ({}) должно быть ненулевым и кратным {}",
                        identities.size(), batch_size)
        );
    }

    std::vector<IdentityBatch> batches;
    batches.reserve(identities.size() / batch_size);
    for (std::size_t begin = 0; begin < identities.size(); begin += batch_size) {
        IdentityBatch batch;
        batch.index = batches.size();
        batch.identities.assign(
            std::make_move_iterator(identities.begin() + static_cast<std::ptrdiff_t>(begin)),
            std::make_move_iterator(identities.begin() + static_cast<std::ptrdiff_t>(begin + batch_size)));
        batch.pubkeys = pubkeys_of(batch.identities);
        batch.proofs = proofs_of(batch.identities);
        batches.push_back(std::move(batch));
    }

    return std::make_unique<ResourcePool>(PrivateTag{}, std::move(batches), batch_size);
}

ResourcePool::ResourcePool(PrivateTag, std::vector<IdentityBatch> batches, std::size_t batch_size)
    : batches_(std::move(batches))
    , batch_size_(batch_size)
    , queued_(batches_.size(), true) {
    for (std::size_t i = 0; i < batches_.size(); ++i) {
        free_.push_back(i);
    }
    monitoring::Metrics::instance().set_idle_identities(
        static_cast<int64_t>(batches_.size() * batch_size_));
}

std::vector<std::size_t> ResourcePool::drain(std::size_t max_count) {
    std::vector<std::size_t> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!free_.empty() && drained.size() < max_count) {
            const std::size_t index = free_.front();
            free_.pop_front();
            queued_[index] = false;
            drained.push_back(index);
        }
    }
    if (!drained.empty()) {
        monitoring::Metrics::instance().add_idle_identities(
            -static_cast<int64_t>(drained.size() * batch_size_));
    }
    return drained;
}

void ResourcePool::release(std::size_t index) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index >= batches_.size()) {
            log::error("release: индекс пакета {} вне диапазона", index);
            return;
        }
        if (queued_[index]) {
            log::error("release: пакет {} уже свободен", index);
            return;
        }
        queued_[index] = true;
        free_.push_back(index);
    }
    monitoring::Metrics::instance().add_idle_identities(static_cast<int64_t>(batch_size_));
}

std::size_t ResourcePool::idle_batches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return free_.size();
}

} // namespace bundleminer::mining
