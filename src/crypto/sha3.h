#pragma once
// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// SHA3-256 (FIPS 202) through the OpenSSL 3 EVP API.

#include "core/types.h"

#include <cstdint>
#include <span>

namespace crypto {

/// Digest of @p data.  Throws std::runtime_error if OpenSSL fails.
[[nodiscard]] core::uint256 sha3_256(std::span<const uint8_t> data);

}  // namespace crypto
