#pragma once
// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Metric calculator -- per-trade inputs to the fee strategies
// ---------------------------------------------------------------------------
// Three metrics are derived from the pool history as it stood before the
// trade:
//
//   relative size   trade size over the moving-average size, in [0, 10]
//   impact          distance between the current and last observation
//   spike count     consecutive spike trades, capped at 10 for scoring
//
// Cold start (no average yet) yields the neutral values 1 / 0 / 0.  None of
// these functions can fail.
// ---------------------------------------------------------------------------

#include "pool/pool_config.h"
#include "pool/pool_metrics.h"

#include <cstdint>
#include <optional>
#include <string>

namespace risk {

/// Upper bound of the relative size ratio.
inline constexpr uint64_t MAX_RELATIVE_SIZE = 10;

/// Upper bound of a normalized PRICE impact.  TICK impact is not capped.
inline constexpr uint64_t MAX_IMPACT = 10;

/// Upper bound of the spike count fed into scoring.
inline constexpr uint32_t MAX_SPIKE_INPUT = 10;

/// A PRICE delta is divided by this before capping: one impact point per
/// 0.01 of price (PRICE_DECIMALS = 8).
inline constexpr uint64_t PRICE_IMPACT_DIVISOR = 1'000'000;

struct TradeMetrics {
    uint64_t relative_size = 1;
    uint64_t impact        = 0;
    uint32_t spike_count   = 0;
    bool     cold_start    = true;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const TradeMetrics&) const = default;
};

/// trade_size / average_trade_size (floor), capped at MAX_RELATIVE_SIZE.
/// Returns 1 when average_trade_size is 0.
[[nodiscard]] uint64_t relative_size(uint64_t trade_size,
                                     uint64_t average_trade_size) noexcept;

/// Absolute movement between two observations in @p unit.  Returns 0 when
/// either side is absent or not a valid observation for the unit.
[[nodiscard]] uint64_t impact(std::optional<int64_t> current,
                              std::optional<int64_t> last,
                              pool::ImpactUnit unit) noexcept;

/// Stored spike counter capped at MAX_SPIKE_INPUT.
[[nodiscard]] uint32_t spike_count(const pool::PoolMetrics& metrics) noexcept;

/// Filter @p value through is_valid_observation().
[[nodiscard]] std::optional<int64_t> valid_observation(
    pool::ImpactUnit unit, std::optional<int64_t> value) noexcept;

/// All three metrics for a prospective trade.
[[nodiscard]] TradeMetrics derive_metrics(
    const pool::PoolMetrics& metrics,
    pool::ImpactUnit unit,
    uint64_t trade_size,
    std::optional<int64_t> current_metric) noexcept;

} // namespace risk
