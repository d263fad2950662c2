// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "risk/state_updater.h"

#include "risk/metrics.h"

#include <limits>

namespace risk {

uint64_t next_average(uint64_t average, uint64_t trade_size) noexcept {
    if (average == 0) return trade_size;

    // With average = 10q + r and trade_size = 10p + t:
    //   (9*average + trade_size) / 10 = 9q + p + (9r + t) / 10
    const uint64_t q = average / 10;
    const uint64_t r = average % 10;
    const uint64_t p = trade_size / 10;
    const uint64_t t = trade_size % 10;
    return 9 * q + p + (9 * r + t) / 10;
}

std::optional<pool::PoolMetrics> apply_trade(
    const pool::PoolMetrics& before,
    const pool::PoolConfig& config,
    uint64_t trade_size,
    std::optional<int64_t> current_metric) noexcept {
    const auto observation =
        valid_observation(config.impact_unit, current_metric);
    if (trade_size == 0 || !observation.has_value()) {
        return std::nullopt;
    }

    pool::PoolMetrics after = before;

    const uint64_t rel = relative_size(trade_size, before.average_trade_size);
    if (rel > config.spike_threshold) {
        if (after.consecutive_spike_count <
            std::numeric_limits<uint32_t>::max()) {
            ++after.consecutive_spike_count;
        }
    } else {
        after.consecutive_spike_count = 0;
    }

    after.last_observed_metric = observation;
    after.average_trade_size = next_average(before.average_trade_size,
                                            trade_size);
    after.last_trade_size = trade_size;
    return after;
}

} // namespace risk
