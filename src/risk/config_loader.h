#pragma once
// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Host-side setup from a core::Config
//
// Pool configuration keys (all optional, missing keys keep the defaults):
//
//   model=discrete|quadratic   impactunit=tick|price   spikethreshold=5
//   feelow=5  feemed=20  feehigh=60  thresholdlow=50  thresholdhigh=150
//   w1=50  w2=30  w3=20
//   basefee=5  maxfee=60  k1=0.5  k2=0.2
//
// Discrete keys are read only for model=discrete, quadratic keys only for
// model=quadratic.  Logging keys are listed in core/config.h.
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"
#include "pool/pool_config.h"

namespace risk {

inline constexpr const char* CONF_MODEL          = "model";
inline constexpr const char* CONF_IMPACTUNIT     = "impactunit";
inline constexpr const char* CONF_SPIKETHRESHOLD = "spikethreshold";
inline constexpr const char* CONF_FEELOW         = "feelow";
inline constexpr const char* CONF_FEEMED         = "feemed";
inline constexpr const char* CONF_FEEHIGH        = "feehigh";
inline constexpr const char* CONF_THRESHOLDLOW   = "thresholdlow";
inline constexpr const char* CONF_THRESHOLDHIGH  = "thresholdhigh";
inline constexpr const char* CONF_W1             = "w1";
inline constexpr const char* CONF_W2             = "w2";
inline constexpr const char* CONF_W3             = "w3";
inline constexpr const char* CONF_BASEFEE        = "basefee";
inline constexpr const char* CONF_MAXFEE         = "maxfee";
inline constexpr const char* CONF_K1             = "k1";
inline constexpr const char* CONF_K2             = "k2";

/// Build and validate a PoolConfig.  Unparseable numbers and unknown
/// model or unit names yield PARSE_* errors; a well-formed but invalid
/// parameter set yields the CONFIG_* error from pool::validate().
[[nodiscard]] core::Result<pool::PoolConfig> load_pool_config(
    const core::Config& conf);

/// Apply loglevel, logcategories, logfile and printtoconsole to the
/// process-wide Logger.  Fails with IO_ERROR if the log file cannot be
/// opened; the other settings are applied regardless.
[[nodiscard]] core::Result<void> init_logging(const core::Config& conf);

} // namespace risk
