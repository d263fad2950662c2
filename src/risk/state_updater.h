#pragma once
// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_config.h"
#include "pool/pool_metrics.h"

#include <cstdint>
#include <optional>

namespace risk {

/// Next value of the trade size moving average:
///   trade_size                      when average == 0
///   floor((average*9 + trade_size) / 10)  otherwise
/// Computed without intermediate overflow.
[[nodiscard]] uint64_t next_average(uint64_t average,
                                    uint64_t trade_size) noexcept;

/// Fold one settled trade into the pool history.
///
/// The spike test compares the trade with the average *before* this trade
/// (the value evaluate() saw): relative size strictly above
/// config.spike_threshold increments the counter (saturating), anything
/// else resets it.  Then the observation is overwritten, the average is
/// advanced and the last size is stored.
///
/// Returns std::nullopt for a degenerate trade (zero size, or no valid
/// observation for the pool's unit); the caller must leave the state
/// untouched in that case.
[[nodiscard]] std::optional<pool::PoolMetrics> apply_trade(
    const pool::PoolMetrics& before,
    const pool::PoolConfig& config,
    uint64_t trade_size,
    std::optional<int64_t> current_metric) noexcept;

} // namespace risk
