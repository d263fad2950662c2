// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/store.h"

#include "core/logging.h"

#include <mutex>
#include <shared_mutex>

namespace pool {

MemoryPoolStore::MemoryPoolStore() = default;
MemoryPoolStore::~MemoryPoolStore() = default;

// ---------------------------------------------------------------------------
// Config (shared lock for reads, exclusive for writes)
// ---------------------------------------------------------------------------

std::optional<PoolConfig> MemoryPoolStore::load_config(
    const PoolId& id) const {
    std::shared_lock lock(mutex_);
    auto it = configs_.find(id);
    if (it == configs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryPoolStore::store_config(const PoolId& id,
                                   const PoolConfig& config) {
    {
        std::unique_lock lock(mutex_);
        configs_.insert_or_assign(id, config);
    }
    LOG_TRACE(core::LogCategory::STORE, "config " + short_id(id));
}

// ---------------------------------------------------------------------------
// Metrics
// ---------------------------------------------------------------------------

std::optional<PoolMetrics> MemoryPoolStore::load_metrics(
    const PoolId& id) const {
    std::shared_lock lock(mutex_);
    auto it = metrics_.find(id);
    if (it == metrics_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryPoolStore::store_metrics(const PoolId& id,
                                    const PoolMetrics& metrics) {
    {
        std::unique_lock lock(mutex_);
        metrics_.insert_or_assign(id, metrics);
    }
    LOG_TRACE(core::LogCategory::STORE,
              "metrics " + short_id(id) + " " + metrics.to_string());
}

size_t MemoryPoolStore::metrics_count() const {
    std::shared_lock lock(mutex_);
    return metrics_.size();
}

size_t MemoryPoolStore::config_count() const {
    std::shared_lock lock(mutex_);
    return configs_.size();
}

} // namespace pool
