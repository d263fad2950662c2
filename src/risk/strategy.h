#pragma once
// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Fee strategies -- map trade metrics to a fee in basis points
// ---------------------------------------------------------------------------
// Both strategies share the FeeStrategy calling contract and differ only in
// how the metrics become a fee:
//
//   DiscreteTierStrategy
//     score = clamp(w1*relative_size + w2*impact + w3*spike_count, 0, 255)
//     score <  threshold_low                   -> fee_low
//     threshold_low <= score < threshold_high  -> fee_med
//     score >= threshold_high                  -> fee_high
//
//   QuadraticImpactStrategy
//     fee = clamp(base_fee + k1*impact + k2*impact^2, base_fee, max_fee)
//     k1 and k2 are tenths; each product is floored before summing, so
//     impact 15 with the defaults gives 5 + 7 + 45 = 57.
//
// A strategy handed a config that carries the other model's parameters
// prices with its own defaults.  All arithmetic is integer and saturating.
// ---------------------------------------------------------------------------

#include "pool/pool_config.h"
#include "pool/pool_metrics.h"
#include "risk/metrics.h"

#include <cstdint>
#include <optional>
#include <string>

namespace risk {

/// Largest value of the discrete model's risk score.
inline constexpr uint8_t MAX_RISK_SCORE = 255;

// ---------------------------------------------------------------------------
// FeeAssessment -- detailed fee decision
// ---------------------------------------------------------------------------
struct FeeAssessment {
    /// Fee to charge, in bps.
    uint32_t fee_bps = 0;

    /// Model that produced the fee.
    pool::FeeModel model = pool::FeeModel::DISCRETE;

    /// Risk score (discrete model only, 0 otherwise).
    uint8_t score = 0;

    /// Inputs the decision was based on.
    TradeMetrics metrics;

    [[nodiscard]] std::string to_string() const;
};

// ---------------------------------------------------------------------------
// FeeStrategy -- common interface
// ---------------------------------------------------------------------------
class FeeStrategy {
public:
    virtual ~FeeStrategy() = default;

    [[nodiscard]] virtual pool::FeeModel model() const noexcept = 0;

    /// Price a prospective trade against the pool state before the trade.
    [[nodiscard]] virtual FeeAssessment compute_fee(
        const pool::PoolConfig& config,
        const pool::PoolMetrics& metrics,
        uint64_t trade_size,
        std::optional<int64_t> current_metric) const = 0;
};

class DiscreteTierStrategy final : public FeeStrategy {
public:
    [[nodiscard]] pool::FeeModel model() const noexcept override {
        return pool::FeeModel::DISCRETE;
    }

    [[nodiscard]] FeeAssessment compute_fee(
        const pool::PoolConfig& config,
        const pool::PoolMetrics& metrics,
        uint64_t trade_size,
        std::optional<int64_t> current_metric) const override;

    /// Weighted score, saturating at MAX_RISK_SCORE.
    [[nodiscard]] static uint8_t risk_score(
        const pool::DiscreteFeeParams& params,
        const TradeMetrics& metrics) noexcept;

    /// Half-open tier lookup.
    [[nodiscard]] static uint32_t fee_for_score(
        const pool::DiscreteFeeParams& params, uint32_t score) noexcept;
};

class QuadraticImpactStrategy final : public FeeStrategy {
public:
    [[nodiscard]] pool::FeeModel model() const noexcept override {
        return pool::FeeModel::QUADRATIC;
    }

    [[nodiscard]] FeeAssessment compute_fee(
        const pool::PoolConfig& config,
        const pool::PoolMetrics& metrics,
        uint64_t trade_size,
        std::optional<int64_t> current_metric) const override;

    [[nodiscard]] static uint32_t fee_for_impact(
        const pool::QuadraticFeeParams& params, uint64_t impact) noexcept;
};

/// Strategy selected by the config's parameter set.
[[nodiscard]] const FeeStrategy& strategy_for(
    const pool::PoolConfig& config) noexcept;

} // namespace risk
