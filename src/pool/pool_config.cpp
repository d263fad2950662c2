// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_config.h"

#include <sstream>
#include <string>

namespace pool {

std::string_view impact_unit_name(ImpactUnit unit) noexcept {
    switch (unit) {
        case ImpactUnit::TICK:  return "tick";
        case ImpactUnit::PRICE: return "price";
    }
    return "unknown";
}

std::string_view fee_model_name(FeeModel model) noexcept {
    switch (model) {
        case FeeModel::DISCRETE:  return "discrete";
        case FeeModel::QUADRATIC: return "quadratic";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// PoolConfig
// ---------------------------------------------------------------------------

PoolConfig PoolConfig::discrete(DiscreteFeeParams params, ImpactUnit unit) {
    PoolConfig config;
    config.model = params;
    config.impact_unit = unit;
    return config;
}

PoolConfig PoolConfig::quadratic(QuadraticFeeParams params, ImpactUnit unit) {
    PoolConfig config;
    config.model = params;
    config.impact_unit = unit;
    return config;
}

FeeModel PoolConfig::fee_model() const noexcept {
    return std::holds_alternative<QuadraticFeeParams>(model)
               ? FeeModel::QUADRATIC
               : FeeModel::DISCRETE;
}

std::string PoolConfig::to_string() const {
    std::ostringstream oss;
    oss << fee_model_name(fee_model())
        << " unit=" << impact_unit_name(impact_unit)
        << " spike>" << spike_threshold;

    if (const auto* d = std::get_if<DiscreteFeeParams>(&model)) {
        oss << " fees=" << d->fee_low << '/' << d->fee_med << '/'
            << d->fee_high << "bps"
            << " thresholds=" << d->threshold_low << '/' << d->threshold_high
            << " weights=" << d->w1 << '/' << d->w2 << '/' << d->w3;
    } else if (const auto* q = std::get_if<QuadraticFeeParams>(&model)) {
        oss << " base=" << q->base_fee << "bps max=" << q->max_fee << "bps"
            << " k1=" << q->k1.to_string() << " k2=" << q->k2.to_string();
    }
    return oss.str();
}

// ---------------------------------------------------------------------------
// validate
// ---------------------------------------------------------------------------

namespace {

core::Result<void> check_fee(std::string_view name, uint32_t fee) {
    if (!primitives::is_valid_fee_bps(fee)) {
        return core::make_error(
            core::ErrorCode::CONFIG_FEE_OUT_OF_BOUNDS,
            std::string{name} + "=" + std::to_string(fee) +
            " outside (0, " + std::to_string(primitives::MAX_FEE_BPS) + "]");
    }
    return core::make_ok();
}

core::Result<void> validate_discrete(const DiscreteFeeParams& p) {
    SANDGUARD_TRY_VOID(check_fee("fee_low", p.fee_low));
    SANDGUARD_TRY_VOID(check_fee("fee_med", p.fee_med));
    SANDGUARD_TRY_VOID(check_fee("fee_high", p.fee_high));

    if (!(p.fee_low < p.fee_med && p.fee_med < p.fee_high)) {
        return core::make_error(
            core::ErrorCode::CONFIG_INVALID_FEE_RANGE,
            "fee tiers must be strictly increasing, got " +
            std::to_string(p.fee_low) + "/" + std::to_string(p.fee_med) +
            "/" + std::to_string(p.fee_high));
    }
    if (p.threshold_low >= p.threshold_high) {
        return core::make_error(
            core::ErrorCode::CONFIG_INVALID_THRESHOLD_ORDER,
            "threshold_low " + std::to_string(p.threshold_low) +
            " must be below threshold_high " +
            std::to_string(p.threshold_high));
    }
    return core::make_ok();
}

core::Result<void> validate_quadratic(const QuadraticFeeParams& p) {
    SANDGUARD_TRY_VOID(check_fee("base_fee", p.base_fee));
    SANDGUARD_TRY_VOID(check_fee("max_fee", p.max_fee));

    if (p.max_fee <= p.base_fee) {
        return core::make_error(
            core::ErrorCode::CONFIG_INVALID_FEE_RANGE,
            "max_fee " + std::to_string(p.max_fee) +
            " must exceed base_fee " + std::to_string(p.base_fee));
    }
    return core::make_ok();
}

} // namespace

core::Result<void> validate(const PoolConfig& config) {
    if (const auto* d = std::get_if<DiscreteFeeParams>(&config.model)) {
        return validate_discrete(*d);
    }
    return validate_quadratic(std::get<QuadraticFeeParams>(config.model));
}

} // namespace pool
