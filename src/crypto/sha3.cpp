// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha3.h"

#include <array>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace crypto {

namespace {

struct EVP_MD_Del { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };
using EVP_MD_ptr = std::unique_ptr<EVP_MD_CTX, EVP_MD_Del>;

}  // namespace

core::uint256 sha3_256(std::span<const uint8_t> data) {
    EVP_MD_ptr ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        throw std::runtime_error("sha3_256: EVP_MD_CTX_new() failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1) {
        throw std::runtime_error("sha3_256: EVP_DigestInit_ex() failed");
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("sha3_256: EVP_DigestUpdate() failed");
    }

    std::array<uint8_t, 32> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1 ||
        digest_len != digest.size()) {
        throw std::runtime_error("sha3_256: EVP_DigestFinal_ex() failed");
    }
    return core::uint256::from_bytes_be(digest);
}

}  // namespace crypto
