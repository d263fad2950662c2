#pragma once
// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// PoolConfig -- per-pool tunable fee parameters
// ---------------------------------------------------------------------------
// A pool is priced by exactly one fee model, chosen by which parameter set
// the config carries:
//
//   DiscreteFeeParams   weighted risk score mapped through three fee tiers
//   QuadraticFeeParams  base fee plus linear and quadratic impact terms
//
// The impact unit (tick or price) and the spike threshold are shared by
// both models.  Defaults are the discrete model with tick impact.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "primitives/fees.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace pool {

// ---------------------------------------------------------------------------
// Observation units
// ---------------------------------------------------------------------------

enum class ImpactUnit : uint8_t {
    TICK  = 0,   ///< tick index, used as-is
    PRICE = 1,   ///< price with PRICE_DECIMALS fractional digits
};

/// Inclusive tick range accepted as a valid observation.
inline constexpr int64_t MIN_TICK = -887272;
inline constexpr int64_t MAX_TICK = 887272;

/// Fractional digits of a PRICE observation (1.0 == 100'000'000).
inline constexpr int PRICE_DECIMALS = 8;

/// True when @p value is a usable observation for @p unit.
[[nodiscard]] constexpr bool is_valid_observation(ImpactUnit unit,
                                                  int64_t value) noexcept {
    if (unit == ImpactUnit::TICK) {
        return value >= MIN_TICK && value <= MAX_TICK;
    }
    return value > 0;
}

[[nodiscard]] std::string_view impact_unit_name(ImpactUnit unit) noexcept;

// ---------------------------------------------------------------------------
// Fee model parameter sets
// ---------------------------------------------------------------------------

enum class FeeModel : uint8_t {
    DISCRETE  = 0,
    QUADRATIC = 1,
};

[[nodiscard]] std::string_view fee_model_name(FeeModel model) noexcept;

/// Weighted discrete-tier model.  Fees in bps, thresholds in score units.
struct DiscreteFeeParams {
    uint32_t fee_low        = 5;
    uint32_t fee_med        = 20;
    uint32_t fee_high       = 60;
    uint32_t threshold_low  = 50;
    uint32_t threshold_high = 150;
    uint32_t w1             = 50;   ///< relative size weight
    uint32_t w2             = 30;   ///< impact weight
    uint32_t w3             = 20;   ///< spike count weight

    bool operator==(const DiscreteFeeParams&) const = default;
};

/// Continuous quadratic model.  Fees in bps.
struct QuadraticFeeParams {
    uint32_t base_fee = 5;
    uint32_t max_fee  = 60;
    primitives::Coefficient k1{5};   ///< 0.5
    primitives::Coefficient k2{2};   ///< 0.2

    bool operator==(const QuadraticFeeParams&) const = default;
};

/// Default spike threshold: a trade more than 5x the average is a spike.
inline constexpr uint32_t DEFAULT_SPIKE_THRESHOLD = 5;

// ---------------------------------------------------------------------------
// PoolConfig
// ---------------------------------------------------------------------------

struct PoolConfig {
    std::variant<DiscreteFeeParams, QuadraticFeeParams> model{
        DiscreteFeeParams{}};
    ImpactUnit impact_unit   = ImpactUnit::TICK;
    uint32_t spike_threshold = DEFAULT_SPIKE_THRESHOLD;

    /// Convenience constructors for each model.
    static PoolConfig discrete(DiscreteFeeParams params = {},
                               ImpactUnit unit = ImpactUnit::TICK);
    static PoolConfig quadratic(QuadraticFeeParams params = {},
                                ImpactUnit unit = ImpactUnit::TICK);

    [[nodiscard]] FeeModel fee_model() const noexcept;

    /// One-line human-readable summary for logs.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const PoolConfig&) const = default;
};

/// Check a configuration before it is stored.  The first violated rule is
/// reported:
///   1. a fee outside (0, MAX_FEE_BPS]       -> CONFIG_FEE_OUT_OF_BOUNDS
///   2. fees not strictly increasing /
///      max_fee not above base_fee           -> CONFIG_INVALID_FEE_RANGE
///   3. threshold_low >= threshold_high      -> CONFIG_INVALID_THRESHOLD_ORDER
[[nodiscard]] core::Result<void> validate(const PoolConfig& config);

} // namespace pool
