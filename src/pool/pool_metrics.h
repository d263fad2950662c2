#pragma once
// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <string>

namespace pool {

// ---------------------------------------------------------------------------
// PoolMetrics -- per-pool trade history used for risk scoring
// ---------------------------------------------------------------------------
// A default-constructed value is the cold-start state: no observation, zero
// sizes and a zero spike counter.  average_trade_size == 0 is the only
// cold-start signal the scoring code relies on.
// ---------------------------------------------------------------------------
struct PoolMetrics {
    /// Price or tick observed after the last recorded trade.
    std::optional<int64_t> last_observed_metric;

    /// Size of the last recorded trade.
    uint64_t last_trade_size = 0;

    /// Exponential moving average of trade size (90% history, 10% latest).
    uint64_t average_trade_size = 0;

    /// Number of consecutive spike trades.  Saturates at UINT32_MAX.
    uint32_t consecutive_spike_count = 0;

    [[nodiscard]] bool is_cold_start() const noexcept {
        return average_trade_size == 0;
    }

    [[nodiscard]] std::string to_string() const;

    bool operator==(const PoolMetrics&) const = default;
};

} // namespace pool
