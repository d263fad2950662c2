#pragma once
// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <cstdint>
#include <string>

namespace pool {

/// Opaque key identifying one trading venue instance.  The engine only
/// compares and hashes it.
using PoolId = core::uint256;

// ---------------------------------------------------------------------------
// PoolKey -- the fields a v4-style venue uses to name a pool
// ---------------------------------------------------------------------------
// Hosts that already carry a pool id may ignore this type entirely.
// ---------------------------------------------------------------------------
struct PoolKey {
    core::uint160 currency0;
    core::uint160 currency1;
    /// LP fee in hundredths of a bip (uint24 on the venue).
    uint32_t fee = 0;
    /// Tick spacing (int24 on the venue).
    int32_t tick_spacing = 0;
    core::uint160 hooks;

    /// Derive the pool id: SHA3-256 over five 32-byte big-endian words
    /// (addresses left-padded, tick_spacing sign-extended).
    [[nodiscard]] PoolId to_id() const;

    bool operator==(const PoolKey&) const = default;
};

/// Short display form of a pool id used in log lines ("0x" + 16 hex chars).
[[nodiscard]] std::string short_id(const PoolId& id);

} // namespace pool
