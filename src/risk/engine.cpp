// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "risk/engine.h"

#include "core/logging.h"
#include "risk/state_updater.h"

#include <string>

namespace risk {

Engine::Engine(pool::PoolStore& store) : store_(store) {}

// ---------------------------------------------------------------------------
// Trade lifecycle
// ---------------------------------------------------------------------------

FeeAssessment Engine::assess(const pool::PoolId& id,
                             std::optional<int64_t> current_metric,
                             uint64_t trade_size) const {
    const pool::PoolConfig config = get_config(id);
    const pool::PoolMetrics metrics = get_metrics(id);

    FeeAssessment result = strategy_for(config).compute_fee(
        config, metrics, trade_size, current_metric);

    LOG_TRACE(core::LogCategory::STRATEGY,
              "pool " + pool::short_id(id) + " size " +
              std::to_string(trade_size) + " -> " + result.to_string());
    return result;
}

uint32_t Engine::evaluate(const pool::PoolId& id,
                          std::optional<int64_t> current_metric,
                          uint64_t trade_size) const {
    return assess(id, current_metric, trade_size).fee_bps;
}

void Engine::record(const pool::PoolId& id,
                    std::optional<int64_t> current_metric,
                    uint64_t trade_size) {
    const pool::PoolConfig config = get_config(id);
    const pool::PoolMetrics before = get_metrics(id);

    auto after = apply_trade(before, config, trade_size, current_metric);
    if (!after.has_value()) {
        LOG_DEBUG(core::LogCategory::ENGINE,
                  "pool " + pool::short_id(id) +
                  ": skipping degenerate trade (size " +
                  std::to_string(trade_size) + ", metric " +
                  (current_metric ? std::to_string(*current_metric)
                                  : std::string{"none"}) + ")");
        return;
    }

    if (after->consecutive_spike_count > before.consecutive_spike_count) {
        LOG_DEBUG(core::LogCategory::METRICS,
                  "pool " + pool::short_id(id) + ": spike #" +
                  std::to_string(after->consecutive_spike_count) +
                  " (size " + std::to_string(trade_size) + " vs avg " +
                  std::to_string(before.average_trade_size) + ")");
    }

    store_.store_metrics(id, *after);
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

core::Result<void> Engine::set_config(const pool::PoolId& id,
                                      const pool::PoolConfig& config) {
    auto valid = pool::validate(config);
    if (!valid.ok()) {
        LOG_WARN(core::LogCategory::CONFIG,
                 "pool " + pool::short_id(id) + ": rejected config: " +
                 valid.error().message());
        return valid;
    }

    store_.store_config(id, config);
    LOG_INFO(core::LogCategory::CONFIG,
             "pool " + pool::short_id(id) + ": " + config.to_string());
    return core::make_ok();
}

pool::PoolConfig Engine::get_config(const pool::PoolId& id) const {
    return store_.load_config(id).value_or(pool::PoolConfig{});
}

bool Engine::is_configured(const pool::PoolId& id) const {
    return store_.load_config(id).has_value();
}

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------

pool::PoolMetrics Engine::get_metrics(const pool::PoolId& id) const {
    return store_.load_metrics(id).value_or(pool::PoolMetrics{});
}

void Engine::initialize_pool(const pool::PoolId& id) {
    if (store_.load_metrics(id).has_value()) return;
    store_.store_metrics(id, pool::PoolMetrics{});
    LOG_DEBUG(core::LogCategory::ENGINE,
              "pool " + pool::short_id(id) + ": initialized");
}

} // namespace risk
