// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <algorithm>
#include <stdexcept>

namespace core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

/// 4-bit value of a hex character, or -1.
constexpr int hex_digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

template <std::size_t N>
Blob<N> Blob<N>::from_bytes_be(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
Blob<N> Blob<N>::from_hex(std::string_view hex) {
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }
    if (hex.size() > 2 * N) {
        throw std::invalid_argument(
            "hex value longer than " + std::to_string(N) + " bytes");
    }

    // Digit i of the input lands at nibble (pad + i) of the value.
    Blob<N> result;
    const std::size_t pad = 2 * N - hex.size();
    for (std::size_t i = 0; i < hex.size(); ++i) {
        const int v = hex_digit_value(hex[i]);
        if (v < 0) {
            throw std::invalid_argument(
                "invalid hex character '" + std::string(1, hex[i]) + "'");
        }
        const std::size_t nibble = pad + i;
        const int shift = (nibble % 2 == 0) ? 4 : 0;
        result.bytes_[nibble / 2] |= static_cast<uint8_t>(v << shift);
    }
    return result;
}

template <std::size_t N>
std::string Blob<N>::to_hex() const {
    std::string out;
    out.reserve(2 * N);
    for (uint8_t byte : bytes_) {
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return out;
}

template <std::size_t N>
void Blob<N>::write_be(std::span<uint8_t, N> out) const noexcept {
    std::copy(bytes_.begin(), bytes_.end(), out.begin());
}

template <std::size_t N>
bool Blob<N>::is_zero() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0; });
}

template class Blob<32>;
template class Blob<20>;

}  // namespace core
