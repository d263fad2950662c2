#pragma once
// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_config.h"
#include "pool/pool_id.h"
#include "pool/pool_metrics.h"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace pool {

// ---------------------------------------------------------------------------
// PoolStore -- abstract key-value backing store for per-pool state
// ---------------------------------------------------------------------------
// The engine keeps no pool state of its own; everything lives behind this
// interface so a host can back it with a map, a database or a contract
// storage adapter.  Loads return std::nullopt for pools never written.
// ---------------------------------------------------------------------------
class PoolStore {
public:
    virtual ~PoolStore() = default;

    virtual std::optional<PoolConfig> load_config(const PoolId& id) const = 0;
    virtual void store_config(const PoolId& id, const PoolConfig& config) = 0;

    virtual std::optional<PoolMetrics> load_metrics(const PoolId& id) const = 0;
    virtual void store_metrics(const PoolId& id,
                               const PoolMetrics& metrics) = 0;
};

// ---------------------------------------------------------------------------
// MemoryPoolStore -- in-memory PoolStore
// ---------------------------------------------------------------------------
// Thread safety: all public methods are protected by a shared_mutex, so
// distinct pools may be served from distinct threads.  Ordering of
// operations on the same pool is still the caller's responsibility.
// ---------------------------------------------------------------------------
class MemoryPoolStore final : public PoolStore {
public:
    MemoryPoolStore();
    ~MemoryPoolStore() override;

    std::optional<PoolConfig> load_config(const PoolId& id) const override;
    void store_config(const PoolId& id, const PoolConfig& config) override;

    std::optional<PoolMetrics> load_metrics(const PoolId& id) const override;
    void store_metrics(const PoolId& id, const PoolMetrics& metrics) override;

    /// Number of pools with recorded metrics.
    [[nodiscard]] size_t metrics_count() const;

    /// Number of pools with an explicit configuration.
    [[nodiscard]] size_t config_count() const;

private:
    std::unordered_map<PoolId, PoolConfig> configs_;
    std::unordered_map<PoolId, PoolMetrics> metrics_;

    /// Guards configs_ and metrics_.
    mutable std::shared_mutex mutex_;
};

} // namespace pool
