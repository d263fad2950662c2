// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pool/pool_id.h"

#include "crypto/sha3.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace pool {

namespace {

constexpr size_t WORD = 32;

/// Write an address right-aligned into a zeroed 32-byte word.
void put_address(std::span<uint8_t, WORD> word, const core::uint160& addr) {
    addr.write_be(word.subspan<WORD - 20, 20>());
}

/// Write a signed integer as a 32-byte two's-complement big-endian word.
void put_int(std::span<uint8_t, WORD> word, int64_t value) {
    const uint8_t fill = value < 0 ? 0xFF : 0x00;
    for (auto& b : word) b = fill;
    auto v = static_cast<uint64_t>(value);
    for (size_t i = 0; i < 8; ++i) {
        word[WORD - 1 - i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

} // namespace

PoolId PoolKey::to_id() const {
    std::array<uint8_t, 5 * WORD> encoded{};
    std::span<uint8_t, 5 * WORD> out{encoded};

    put_address(out.subspan<0 * WORD, WORD>(), currency0);
    put_address(out.subspan<1 * WORD, WORD>(), currency1);
    put_int(out.subspan<2 * WORD, WORD>(), static_cast<int64_t>(fee));
    put_int(out.subspan<3 * WORD, WORD>(), tick_spacing);
    put_address(out.subspan<4 * WORD, WORD>(), hooks);

    return crypto::sha3_256(encoded);
}

std::string short_id(const PoolId& id) {
    return "0x" + id.to_hex().substr(0, 16);
}

} // namespace pool
