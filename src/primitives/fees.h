#pragma once
// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <compare>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace primitives {

// ---------------------------------------------------------------------------
// Fee units
// ---------------------------------------------------------------------------

/// Fees are expressed in basis points (1 bps = 0.01%).
/// A fee is valid when it lies in (0, MAX_FEE_BPS].
inline constexpr uint32_t MAX_FEE_BPS = 10'000;

[[nodiscard]] constexpr bool is_valid_fee_bps(uint32_t fee_bps) noexcept {
    return fee_bps > 0 && fee_bps <= MAX_FEE_BPS;
}

// ---------------------------------------------------------------------------
// Saturating integer helpers
// ---------------------------------------------------------------------------

[[nodiscard]] constexpr uint64_t saturating_add(uint64_t a,
                                                uint64_t b) noexcept {
    return a > std::numeric_limits<uint64_t>::max() - b
               ? std::numeric_limits<uint64_t>::max()
               : a + b;
}

[[nodiscard]] constexpr uint64_t saturating_mul(uint64_t a,
                                                uint64_t b) noexcept {
    if (a == 0 || b == 0) return 0;
    return a > std::numeric_limits<uint64_t>::max() / b
               ? std::numeric_limits<uint64_t>::max()
               : a * b;
}

// ---------------------------------------------------------------------------
// Coefficient  --  unsigned fixed-point multiplier with one decimal digit
// ---------------------------------------------------------------------------
// The value is stored in tenths: Coefficient(5) is 0.5, Coefficient(12)
// is 1.2.  Multiplying by an integer rounds toward zero (floor), so
// apply(15) on 0.5 yields 7.  Products saturate at UINT64_MAX.
// ---------------------------------------------------------------------------
class Coefficient {
public:
    /// Number of raw units per 1.0.
    static constexpr uint32_t SCALE = 10;

    constexpr Coefficient() = default;

    /// Construct from a raw value in tenths.
    constexpr explicit Coefficient(uint32_t tenths) : raw_(tenths) {}

    /// Parse a decimal with at most one fractional digit ("0.5", "2",
    /// "1.0").  Returns PARSE_BAD_FORMAT for anything else and
    /// PARSE_OVERFLOW when the raw value does not fit in 32 bits.
    static core::Result<Coefficient> parse(std::string_view text);

    /// Raw value in tenths.
    [[nodiscard]] constexpr uint32_t raw() const { return raw_; }

    /// floor(value * x), saturating.
    [[nodiscard]] uint64_t apply(uint64_t x) const noexcept;

    /// Decimal representation, e.g. "0.5".
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Coefficient& o) const { return raw_ == o.raw_; }
    auto operator<=>(const Coefficient& o) const { return raw_ <=> o.raw_; }

private:
    uint32_t raw_ = 0;
};

} // namespace primitives
