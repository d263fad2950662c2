// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "risk/metrics.h"

#include <algorithm>
#include <sstream>

namespace risk {

std::string TradeMetrics::to_string() const {
    std::ostringstream oss;
    oss << "rel=" << relative_size << " impact=" << impact
        << " spikes=" << spike_count;
    if (cold_start) oss << " (cold)";
    return oss.str();
}

uint64_t relative_size(uint64_t trade_size,
                       uint64_t average_trade_size) noexcept {
    if (average_trade_size == 0) return 1;
    return std::min(trade_size / average_trade_size, MAX_RELATIVE_SIZE);
}

std::optional<int64_t> valid_observation(
    pool::ImpactUnit unit, std::optional<int64_t> value) noexcept {
    if (!value.has_value() || !pool::is_valid_observation(unit, *value)) {
        return std::nullopt;
    }
    return value;
}

uint64_t impact(std::optional<int64_t> current,
                std::optional<int64_t> last,
                pool::ImpactUnit unit) noexcept {
    current = valid_observation(unit, current);
    last    = valid_observation(unit, last);
    if (!current || !last) return 0;

    // Unsigned subtraction of the larger minus the smaller never overflows.
    const auto a = static_cast<uint64_t>(*current);
    const auto b = static_cast<uint64_t>(*last);
    const uint64_t delta = (*current >= *last) ? a - b : b - a;

    if (unit == pool::ImpactUnit::TICK) {
        return delta;
    }
    return std::min(delta / PRICE_IMPACT_DIVISOR, MAX_IMPACT);
}

uint32_t spike_count(const pool::PoolMetrics& metrics) noexcept {
    return std::min(metrics.consecutive_spike_count, MAX_SPIKE_INPUT);
}

TradeMetrics derive_metrics(const pool::PoolMetrics& metrics,
                            pool::ImpactUnit unit,
                            uint64_t trade_size,
                            std::optional<int64_t> current_metric) noexcept {
    TradeMetrics out;
    out.relative_size = relative_size(trade_size, metrics.average_trade_size);
    out.impact        = impact(current_metric,
                               metrics.last_observed_metric, unit);
    out.spike_count   = spike_count(metrics);
    out.cold_start    = metrics.is_cold_start();
    return out;
}

} // namespace risk
