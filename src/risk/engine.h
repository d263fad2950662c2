#pragma once
// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Engine -- per-trade fee decisions and post-trade history updates
// ---------------------------------------------------------------------------
// Lifecycle for one trade on one pool:
//
//   fee = engine.evaluate(id, metric_before, size)   // read-only
//   ... host executes the trade at `fee` ...
//   engine.record(id, metric_after, realized_size)   // mutates history
//
// evaluate() and record() are total: cold starts, zero sizes and missing
// observations resolve to neutral defaults and never produce an error.
// Only set_config() can fail, and a rejected config leaves the pool's
// previous config in force.
//
// The engine holds a reference to the store and no pool state of its own.
//
// Thread safety: calls for different pools may run concurrently as long as
// the store allows it (MemoryPoolStore does).  For a single pool the caller
// MUST serialize "evaluate T -> settle T -> record T" against every other
// evaluate/record on that pool; the engine performs no per-pool locking.
// Authorization of set_config() callers is likewise the host's job.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "pool/pool_config.h"
#include "pool/pool_id.h"
#include "pool/pool_metrics.h"
#include "pool/store.h"
#include "risk/strategy.h"

#include <cstdint>
#include <optional>

namespace risk {

class Engine {
public:
    /// @param store  Backing store; must outlive the engine.
    explicit Engine(pool::PoolStore& store);

    Engine(const Engine&)            = delete;
    Engine& operator=(const Engine&) = delete;

    // -- Trade lifecycle ----------------------------------------------------

    /// Fee in bps for a prospective trade.
    ///
    /// @param id              Pool the trade targets.
    /// @param current_metric  Current price/tick, if the host has one.
    /// @param trade_size      Absolute size of the order.
    [[nodiscard]] uint32_t evaluate(const pool::PoolId& id,
                                    std::optional<int64_t> current_metric,
                                    uint64_t trade_size) const;

    /// Same decision as evaluate(), with the score and metrics behind it.
    [[nodiscard]] FeeAssessment assess(const pool::PoolId& id,
                                       std::optional<int64_t> current_metric,
                                       uint64_t trade_size) const;

    /// Fold a settled trade into the pool history.  Zero-size trades and
    /// trades without a valid observation are ignored.
    void record(const pool::PoolId& id,
                std::optional<int64_t> current_metric,
                uint64_t trade_size);

    // -- Configuration ------------------------------------------------------

    /// Validate and store @p config for @p id.  On error nothing changes.
    [[nodiscard]] core::Result<void> set_config(const pool::PoolId& id,
                                                const pool::PoolConfig& config);

    /// Active config: the stored one, or the defaults.
    [[nodiscard]] pool::PoolConfig get_config(const pool::PoolId& id) const;

    /// True once a set_config() call has succeeded for @p id.
    [[nodiscard]] bool is_configured(const pool::PoolId& id) const;

    // -- History ------------------------------------------------------------

    /// Current history, or the cold-start value for unknown pools.
    [[nodiscard]] pool::PoolMetrics get_metrics(const pool::PoolId& id) const;

    /// Create the cold-start history for @p id if none exists yet.
    void initialize_pool(const pool::PoolId& id);

private:
    pool::PoolStore& store_;
};

} // namespace risk
