#pragma once
// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Blob<N> -- fixed-size big-endian value
// ---------------------------------------------------------------------------
// Used for 32-byte pool ids and digests and 20-byte token / hook
// addresses.  Bytes are stored most-significant first, matching both the
// hex display order and the 32-byte word encoding the pool id is hashed
// from, so comparison is plain lexicographic order.
// ---------------------------------------------------------------------------
template <std::size_t N>
class Blob {
public:
    static constexpr std::size_t SIZE = N;

    constexpr Blob() noexcept : bytes_{} {}

    static Blob from_bytes_be(std::span<const uint8_t, N> bytes) noexcept;

    /// Parse up to 2*N hex digits, optionally "0x"-prefixed.  Shorter
    /// input is left-padded with zeros.  Throws std::invalid_argument on
    /// malformed input.
    static Blob from_hex(std::string_view hex);

    /// 2*N lower-case hex digits, no prefix.
    [[nodiscard]] std::string to_hex() const;

    void write_be(std::span<uint8_t, N> out) const noexcept;

    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] bool is_zero() const noexcept;

    auto operator<=>(const Blob&) const = default;
    bool operator==(const Blob&) const = default;

private:
    std::array<uint8_t, N> bytes_;
};

extern template class Blob<32>;
extern template class Blob<20>;

using uint256 = Blob<32>;   ///< pool ids, digests
using uint160 = Blob<20>;   ///< token and hook addresses

}  // namespace core

template <std::size_t N>
struct std::hash<core::Blob<N>> {
    std::size_t operator()(const core::Blob<N>& v) const noexcept {
        // FNV-1a; ids are already uniformly distributed.
        std::size_t h = 14695981039346656037ULL;
        for (auto byte : v.bytes()) {
            h ^= static_cast<std::size_t>(byte);
            h *= 1099511628211ULL;
        }
        return h;
    }
};
