// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_metrics.h"

#include <sstream>

namespace pool {

std::string PoolMetrics::to_string() const {
    std::ostringstream oss;
    oss << "last=";
    if (last_observed_metric.has_value()) {
        oss << *last_observed_metric;
    } else {
        oss << "none";
    }
    oss << " last_size=" << last_trade_size
        << " avg_size=" << average_trade_size
        << " spikes=" << consecutive_spike_count;
    return oss.str();
}

} // namespace pool
