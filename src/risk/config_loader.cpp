// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "risk/config_loader.h"

#include "core/logging.h"
#include "primitives/fees.h"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

namespace risk {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/// Overwrite @p out with the value of @p key when present.
core::Result<void> read_u32(const core::Config& conf, const char* key,
                            uint32_t& out) {
    auto text = conf.get(key);
    if (!text.has_value()) return core::make_ok();

    uint32_t value = 0;
    const char* first = text->data();
    const char* last  = text->data() + text->size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc::result_out_of_range) {
        return core::make_error(core::ErrorCode::PARSE_OVERFLOW,
                                std::string{key} + "='" + *text +
                                "' does not fit in 32 bits");
    }
    if (ec != std::errc{} || ptr != last) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                std::string{key} + "='" + *text +
                                "' is not an unsigned integer");
    }
    out = value;
    return core::make_ok();
}

core::Result<void> read_coefficient(const core::Config& conf, const char* key,
                                    primitives::Coefficient& out) {
    auto text = conf.get(key);
    if (!text.has_value()) return core::make_ok();

    auto parsed = primitives::Coefficient::parse(*text);
    if (!parsed.ok()) {
        return core::make_error(parsed.error().code(),
                                std::string{key} + ": " +
                                parsed.error().message());
    }
    out = parsed.value();
    return core::make_ok();
}

core::Result<pool::DiscreteFeeParams> read_discrete(const core::Config& conf) {
    pool::DiscreteFeeParams p;
    SANDGUARD_TRY_VOID(read_u32(conf, CONF_FEELOW, p.fee_low));
    SANDGUARD_TRY_VOID(read_u32(conf, CONF_FEEMED, p.fee_med));
    SANDGUARD_TRY_VOID(read_u32(conf, CONF_FEEHIGH, p.fee_high));
    SANDGUARD_TRY_VOID(read_u32(conf, CONF_THRESHOLDLOW, p.threshold_low));
    SANDGUARD_TRY_VOID(read_u32(conf, CONF_THRESHOLDHIGH, p.threshold_high));
    SANDGUARD_TRY_VOID(read_u32(conf, CONF_W1, p.w1));
    SANDGUARD_TRY_VOID(read_u32(conf, CONF_W2, p.w2));
    SANDGUARD_TRY_VOID(read_u32(conf, CONF_W3, p.w3));
    return p;
}

core::Result<pool::QuadraticFeeParams> read_quadratic(
    const core::Config& conf) {
    pool::QuadraticFeeParams p;
    SANDGUARD_TRY_VOID(read_u32(conf, CONF_BASEFEE, p.base_fee));
    SANDGUARD_TRY_VOID(read_u32(conf, CONF_MAXFEE, p.max_fee));
    SANDGUARD_TRY_VOID(read_coefficient(conf, CONF_K1, p.k1));
    SANDGUARD_TRY_VOID(read_coefficient(conf, CONF_K2, p.k2));
    return p;
}

} // namespace

// ---------------------------------------------------------------------------
// load_pool_config
// ---------------------------------------------------------------------------

core::Result<pool::PoolConfig> load_pool_config(const core::Config& conf) {
    pool::PoolConfig config;

    const std::string unit = conf.get_or(CONF_IMPACTUNIT, "tick");
    if (iequals(unit, "tick")) {
        config.impact_unit = pool::ImpactUnit::TICK;
    } else if (iequals(unit, "price")) {
        config.impact_unit = pool::ImpactUnit::PRICE;
    } else {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "unknown impactunit '" + unit + "'");
    }

    SANDGUARD_TRY_VOID(
        read_u32(conf, CONF_SPIKETHRESHOLD, config.spike_threshold));

    const std::string model = conf.get_or(CONF_MODEL, "discrete");
    if (iequals(model, "discrete")) {
        SANDGUARD_TRY_ASSIGN(params, read_discrete(conf));
        config.model = params;
    } else if (iequals(model, "quadratic")) {
        SANDGUARD_TRY_ASSIGN(params, read_quadratic(conf));
        config.model = params;
    } else {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "unknown model '" + model + "'");
    }

    SANDGUARD_TRY_VOID(pool::validate(config));

    LOG_DEBUG(core::LogCategory::CONFIG,
              "loaded pool config: " + config.to_string());
    return config;
}

// ---------------------------------------------------------------------------
// init_logging
// ---------------------------------------------------------------------------

core::Result<void> init_logging(const core::Config& conf) {
    auto& logger = core::Logger::instance();

    if (auto level = conf.get(core::CONF_LOGLEVEL)) {
        logger.set_level(core::parse_log_level(*level, logger.level()));
    }
    if (auto cats = conf.get(core::CONF_LOGCATEGORIES)) {
        logger.set_categories(core::parse_log_categories(*cats));
    }
    logger.set_print_to_console(
        conf.get_bool(core::CONF_PRINTTOCONSOLE, true));

    if (auto file = conf.get(core::CONF_LOGFILE); file && !file->empty()) {
        SANDGUARD_TRY_VOID(logger.set_log_file(*file));
    }
    return core::make_ok();
}

} // namespace risk
