// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/keccak.h"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace crypto {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

/// Perform a single SHA3-256 digest into @p out.
void raw_keccak256(const void* data, size_t len, Digest256& out) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error(
            "keccak256: EVP_MD_CTX_new() allocation failed");
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1) {
        throw std::runtime_error("keccak256: EVP_DigestInit_ex() failed");
    }

    if (len > 0 && EVP_DigestUpdate(ctx.get(), data, len) != 1) {
        throw std::runtime_error("keccak256: EVP_DigestUpdate() failed");
    }

    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &digest_len) != 1 ||
        digest_len != out.size()) {
        throw std::runtime_error("keccak256: EVP_DigestFinal_ex() failed");
    }
}

}  // namespace

Digest256 keccak256(std::span<const uint8_t> data) {
    Digest256 out{};
    raw_keccak256(data.data(), data.size(), out);
    return out;
}

uint32_t keccak256_checksum(std::span<const uint8_t> data) {
    Digest256 digest = keccak256(data);
    return static_cast<uint32_t>(digest[0])
         | (static_cast<uint32_t>(digest[1]) << 8)
         | (static_cast<uint32_t>(digest[2]) << 16)
         | (static_cast<uint32_t>(digest[3]) << 24);
}

}  // namespace crypto
