// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the discrete and quadratic fee strategies.

#include "test_framework.h"

#include "pool/pool_config.h"
#include "pool/pool_metrics.h"
#include "risk/metrics.h"
#include "risk/strategy.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

using pool::FeeModel;
using pool::ImpactUnit;
using risk::DiscreteTierStrategy;
using risk::QuadraticImpactStrategy;

namespace {

/// History with a known average and last tick, for impact-driven tests.
pool::PoolMetrics warm_metrics(uint64_t avg, int64_t last_tick) {
    pool::PoolMetrics m;
    m.average_trade_size = avg;
    m.last_trade_size = avg;
    m.last_observed_metric = last_tick;
    return m;
}

} // namespace

// ============================================================================
// Worked examples
// ============================================================================

TEST_CASE(Strategy, discrete_cold_start_lands_in_medium_tier) {
    const pool::PoolConfig config;
    auto a = risk::strategy_for(config).compute_fee(
        config, pool::PoolMetrics{}, 100, std::nullopt);
    CHECK_EQ(a.metrics.relative_size, 1u);
    CHECK_EQ(a.metrics.impact, 0u);
    CHECK_EQ(a.metrics.spike_count, 0u);
    CHECK_EQ(a.score, 50);
    CHECK_EQ(a.fee_bps, 20u);
    CHECK(a.model == FeeModel::DISCRETE);
    CHECK(a.to_string().find("20bps") != std::string::npos);
}

TEST_CASE(Strategy, quadratic_cold_start_is_base_fee) {
    const auto config = pool::PoolConfig::quadratic();
    auto a = risk::strategy_for(config).compute_fee(
        config, pool::PoolMetrics{}, 100, 500);
    CHECK_EQ(a.metrics.impact, 0u);
    CHECK_EQ(a.fee_bps, 5u);
    CHECK(a.model == FeeModel::QUADRATIC);
}

TEST_CASE(Strategy, quadratic_delta_ten) {
    const auto config = pool::PoolConfig::quadratic();
    auto a = risk::strategy_for(config).compute_fee(
        config, warm_metrics(100, 1000), 100, 1010);
    CHECK_EQ(a.metrics.impact, 10u);
    CHECK_EQ(a.fee_bps, 30u);
}

TEST_CASE(Strategy, quadratic_delta_fifteen_floors_to_57) {
    const auto config = pool::PoolConfig::quadratic();
    auto a = risk::strategy_for(config).compute_fee(
        config, warm_metrics(100, 1000), 100, 985);
    CHECK_EQ(a.metrics.impact, 15u);
    CHECK_EQ(a.fee_bps, 57u);
}

TEST_CASE(Strategy, quadratic_price_unit) {
    const auto config =
        pool::PoolConfig::quadratic({}, ImpactUnit::PRICE);
    pool::PoolMetrics m;
    m.average_trade_size = 100;
    m.last_observed_metric = 100'000'000;   // 1.00000000
    auto a = risk::strategy_for(config).compute_fee(
        config, m, 100, 110'000'000);        // 1.10000000
    CHECK_EQ(a.metrics.impact, 10u);
    CHECK_EQ(a.fee_bps, 30u);
}

// ============================================================================
// Discrete tiers
// ============================================================================

TEST_CASE(Strategy, discrete_tiers_are_half_open) {
    const pool::DiscreteFeeParams p;
    CHECK_EQ(DiscreteTierStrategy::fee_for_score(p, 0), 5u);
    CHECK_EQ(DiscreteTierStrategy::fee_for_score(p, 49), 5u);
    CHECK_EQ(DiscreteTierStrategy::fee_for_score(p, 50), 20u);
    CHECK_EQ(DiscreteTierStrategy::fee_for_score(p, 149), 20u);
    CHECK_EQ(DiscreteTierStrategy::fee_for_score(p, 150), 60u);
    CHECK_EQ(DiscreteTierStrategy::fee_for_score(p, 255), 60u);
}

TEST_CASE(Strategy, discrete_score_weights) {
    const pool::DiscreteFeeParams p;
    risk::TradeMetrics tm;
    tm.relative_size = 2;
    tm.impact = 1;
    tm.spike_count = 1;
    CHECK_EQ(DiscreteTierStrategy::risk_score(p, tm), 100 + 30 + 20);

    tm.relative_size = 0;
    tm.impact = 0;
    tm.spike_count = 0;
    CHECK_EQ(DiscreteTierStrategy::risk_score(p, tm), 0);
}

TEST_CASE(Strategy, discrete_score_saturates) {
    const pool::DiscreteFeeParams p;
    risk::TradeMetrics tm;
    tm.relative_size = risk::MAX_RELATIVE_SIZE;
    tm.impact = std::numeric_limits<uint64_t>::max();
    tm.spike_count = risk::MAX_SPIKE_INPUT;
    CHECK_EQ(DiscreteTierStrategy::risk_score(p, tm), risk::MAX_RISK_SCORE);
}

TEST_CASE(Strategy, discrete_impact_pushes_tier) {
    const pool::PoolConfig config;
    const auto m = warm_metrics(100, 0);
    const auto& s = risk::strategy_for(config);

    CHECK_EQ(s.compute_fee(config, m, 100, 0).fee_bps, 20u);    // 50
    CHECK_EQ(s.compute_fee(config, m, 100, 2).fee_bps, 20u);    // 110
    CHECK_EQ(s.compute_fee(config, m, 100, 4).fee_bps, 60u);    // 170
    CHECK_EQ(s.compute_fee(config, m, 50, 0).fee_bps, 5u);      // 0
}

TEST_CASE(Strategy, discrete_fee_monotone_in_size) {
    const pool::PoolConfig config;
    const auto m = warm_metrics(100, 0);
    const auto& s = risk::strategy_for(config);

    uint32_t prev = 0;
    for (uint64_t size = 1; size <= 2000; size += 7) {
        uint32_t fee = s.compute_fee(config, m, size, 0).fee_bps;
        CHECK(fee >= prev);
        prev = fee;
    }
    CHECK_EQ(prev, 60u);
}

// ============================================================================
// Quadratic curve
// ============================================================================

TEST_CASE(Strategy, quadratic_bounded_and_monotone) {
    const pool::QuadraticFeeParams p;
    uint32_t prev = 0;
    for (uint64_t impact = 0; impact <= 100; ++impact) {
        uint32_t fee = QuadraticImpactStrategy::fee_for_impact(p, impact);
        CHECK(fee >= p.base_fee);
        CHECK(fee <= p.max_fee);
        CHECK(fee >= prev);
        prev = fee;
    }
    CHECK_EQ(QuadraticImpactStrategy::fee_for_impact(
                 p, std::numeric_limits<uint64_t>::max()),
             p.max_fee);
}

TEST_CASE(Strategy, quadratic_superlinear_below_cap) {
    pool::QuadraticFeeParams p;
    p.max_fee = 10'000;
    for (uint64_t x = 1; x <= 100; ++x) {
        uint32_t single = QuadraticImpactStrategy::fee_for_impact(p, x) -
                          p.base_fee;
        uint32_t twice = QuadraticImpactStrategy::fee_for_impact(p, 2 * x) -
                         p.base_fee;
        CHECK(twice >= 2 * single);
    }
}

TEST_CASE(Strategy, quadratic_zero_coefficients_flat) {
    pool::QuadraticFeeParams p;
    p.k1 = primitives::Coefficient{0};
    p.k2 = primitives::Coefficient{0};
    CHECK_EQ(QuadraticImpactStrategy::fee_for_impact(p, 0), p.base_fee);
    CHECK_EQ(QuadraticImpactStrategy::fee_for_impact(p, 5000), p.base_fee);
}

TEST_CASE(Strategy, quadratic_tick_cap) {
    const auto config = pool::PoolConfig::quadratic();
    auto a = risk::strategy_for(config).compute_fee(
        config, warm_metrics(100, pool::MIN_TICK), 100, pool::MAX_TICK);
    CHECK_EQ(a.fee_bps, 60u);
    CHECK_EQ(a.score, 0);
}

// ============================================================================
// Selection and mismatched params
// ============================================================================

TEST_CASE(Strategy, strategy_for_selects_model) {
    CHECK(risk::strategy_for(pool::PoolConfig{}).model() ==
          FeeModel::DISCRETE);
    CHECK(risk::strategy_for(pool::PoolConfig::quadratic()).model() ==
          FeeModel::QUADRATIC);
}

TEST_CASE(Strategy, mismatched_params_fall_back_to_defaults) {
    pool::QuadraticFeeParams q;
    q.base_fee = 100;
    q.max_fee = 200;
    const auto quadratic_config = pool::PoolConfig::quadratic(q);

    DiscreteTierStrategy discrete;
    auto a = discrete.compute_fee(quadratic_config, pool::PoolMetrics{},
                                  100, std::nullopt);
    CHECK_EQ(a.fee_bps, 20u);

    pool::DiscreteFeeParams d;
    d.fee_low = 1000;
    d.fee_med = 2000;
    d.fee_high = 3000;
    const auto discrete_config = pool::PoolConfig::discrete(d);

    QuadraticImpactStrategy quadratic;
    auto b = quadratic.compute_fee(discrete_config, pool::PoolMetrics{},
                                   100, std::nullopt);
    CHECK_EQ(b.fee_bps, 5u);
}

TEST_CASE(Strategy, compute_fee_is_deterministic) {
    const auto config = pool::PoolConfig::quadratic();
    const auto m = warm_metrics(250, -40);
    const auto& s = risk::strategy_for(config);
    auto first = s.compute_fee(config, m, 900, -33).fee_bps;
    for (int i = 0; i < 10; ++i) {
        CHECK_EQ(s.compute_fee(config, m, 900, -33).fee_bps, first);
    }
}
