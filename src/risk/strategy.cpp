// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "risk/strategy.h"

#include "primitives/fees.h"

#include <algorithm>
#include <sstream>
#include <variant>

namespace risk {

using primitives::saturating_add;
using primitives::saturating_mul;

std::string FeeAssessment::to_string() const {
    std::ostringstream oss;
    oss << fee_bps << "bps (" << pool::fee_model_name(model);
    if (model == pool::FeeModel::DISCRETE) {
        oss << " score=" << static_cast<unsigned>(score);
    }
    oss << ", " << metrics.to_string() << ')';
    return oss.str();
}

// ===========================================================================
// DiscreteTierStrategy
// ===========================================================================

uint8_t DiscreteTierStrategy::risk_score(
    const pool::DiscreteFeeParams& params,
    const TradeMetrics& metrics) noexcept {
    uint64_t score = saturating_mul(params.w1, metrics.relative_size);
    score = saturating_add(score, saturating_mul(params.w2, metrics.impact));
    score = saturating_add(score,
                           saturating_mul(params.w3, metrics.spike_count));
    return static_cast<uint8_t>(
        std::min<uint64_t>(score, MAX_RISK_SCORE));
}

uint32_t DiscreteTierStrategy::fee_for_score(
    const pool::DiscreteFeeParams& params, uint32_t score) noexcept {
    if (score < params.threshold_low)  return params.fee_low;
    if (score < params.threshold_high) return params.fee_med;
    return params.fee_high;
}

FeeAssessment DiscreteTierStrategy::compute_fee(
    const pool::PoolConfig& config,
    const pool::PoolMetrics& metrics,
    uint64_t trade_size,
    std::optional<int64_t> current_metric) const {
    const auto* configured = std::get_if<pool::DiscreteFeeParams>(&config.model);
    const pool::DiscreteFeeParams params =
        configured ? *configured : pool::DiscreteFeeParams{};

    FeeAssessment out;
    out.model   = pool::FeeModel::DISCRETE;
    out.metrics = derive_metrics(metrics, config.impact_unit,
                                 trade_size, current_metric);
    out.score   = risk_score(params, out.metrics);
    out.fee_bps = fee_for_score(params, out.score);
    return out;
}

// ===========================================================================
// QuadraticImpactStrategy
// ===========================================================================

uint32_t QuadraticImpactStrategy::fee_for_impact(
    const pool::QuadraticFeeParams& params, uint64_t impact) noexcept {
    uint64_t fee = params.base_fee;
    fee = saturating_add(fee, params.k1.apply(impact));
    fee = saturating_add(fee, params.k2.apply(saturating_mul(impact, impact)));

    // fee >= base_fee already holds; only the upper bound can bind.
    return static_cast<uint32_t>(
        std::min<uint64_t>(fee, params.max_fee));
}

FeeAssessment QuadraticImpactStrategy::compute_fee(
    const pool::PoolConfig& config,
    const pool::PoolMetrics& metrics,
    uint64_t trade_size,
    std::optional<int64_t> current_metric) const {
    const auto* configured =
        std::get_if<pool::QuadraticFeeParams>(&config.model);
    const pool::QuadraticFeeParams params =
        configured ? *configured : pool::QuadraticFeeParams{};

    FeeAssessment out;
    out.model   = pool::FeeModel::QUADRATIC;
    out.metrics = derive_metrics(metrics, config.impact_unit,
                                 trade_size, current_metric);
    out.fee_bps = fee_for_impact(params, out.metrics.impact);
    return out;
}

// ===========================================================================
// strategy_for
// ===========================================================================

const FeeStrategy& strategy_for(const pool::PoolConfig& config) noexcept {
    static const DiscreteTierStrategy discrete;
    static const QuadraticImpactStrategy quadratic;

    switch (config.fee_model()) {
        case pool::FeeModel::QUADRATIC: return quadratic;
        case pool::FeeModel::DISCRETE:  break;
    }
    return discrete;
}

} // namespace risk
