// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/fees.h"

#include <charconv>
#include <cstdint>
#include <string>

namespace primitives {

core::Result<Coefficient> Coefficient::parse(std::string_view text) {
    if (text.empty()) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "empty coefficient");
    }

    std::string_view whole = text;
    std::string_view frac;
    if (auto dot = text.find('.'); dot != std::string_view::npos) {
        whole = text.substr(0, dot);
        frac  = text.substr(dot + 1);
        if (frac.size() != 1 || frac[0] < '0' || frac[0] > '9') {
            return core::make_error(
                core::ErrorCode::PARSE_BAD_FORMAT,
                "coefficient '" + std::string{text} +
                "' must have exactly one digit after the point");
        }
    }
    if (whole.empty()) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "coefficient '" + std::string{text} +
                                "' has no integer part");
    }

    uint64_t units = 0;
    auto [ptr, ec] = std::from_chars(whole.data(),
                                     whole.data() + whole.size(), units);
    if (ec == std::errc::result_out_of_range) {
        return core::make_error(core::ErrorCode::PARSE_OVERFLOW,
                                "coefficient '" + std::string{text} +
                                "' is too large");
    }
    if (ec != std::errc{} || ptr != whole.data() + whole.size()) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "cannot parse coefficient '" +
                                std::string{text} + "'");
    }

    uint64_t raw = saturating_mul(units, SCALE);
    if (!frac.empty()) {
        raw = saturating_add(raw, static_cast<uint64_t>(frac[0] - '0'));
    }
    if (raw > std::numeric_limits<uint32_t>::max()) {
        return core::make_error(core::ErrorCode::PARSE_OVERFLOW,
                                "coefficient '" + std::string{text} +
                                "' is too large");
    }
    return Coefficient(static_cast<uint32_t>(raw));
}

uint64_t Coefficient::apply(uint64_t x) const noexcept {
    // floor(raw * x / SCALE) split so the intermediate never exceeds
    // the result:  raw*(x/SCALE) + floor(raw*(x%SCALE)/SCALE).
    uint64_t head = saturating_mul(raw_, x / SCALE);
    uint64_t tail = (static_cast<uint64_t>(raw_) * (x % SCALE)) / SCALE;
    return saturating_add(head, tail);
}

std::string Coefficient::to_string() const {
    return std::to_string(raw_ / SCALE) + "." + std::to_string(raw_ % SCALE);
}

} // namespace primitives
