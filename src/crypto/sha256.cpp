// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha256.h"

#include <memory>

#include <openssl/evp.h>

namespace crypto {

namespace {

// RAII wrapper for EVP_MD_CTX
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

} // namespace

core::Result<Sha256Digest> sha256(std::span<const uint8_t> data) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return core::Error(core::ErrorCode::CRYPTO_HASH_FAIL,
                           "sha256: EVP_MD_CTX_new() allocation failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return core::Error(core::ErrorCode::CRYPTO_HASH_FAIL,
                           "sha256: EVP_DigestInit_ex() failed");
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return core::Error(core::ErrorCode::CRYPTO_HASH_FAIL,
                           "sha256: EVP_DigestUpdate() failed");
    }

    Sha256Digest out{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &digest_len) != 1 ||
        digest_len != out.size()) {
        return core::Error(core::ErrorCode::CRYPTO_HASH_FAIL,
                           "sha256: EVP_DigestFinal_ex() failed");
    }
    return out;
}

core::Result<core::uint256> sha256d(std::span<const uint8_t> data) {
    TXCOMBINE_TRY_ASSIGN(first, sha256(data));
    TXCOMBINE_TRY_ASSIGN(second, sha256(first));
    return core::uint256::from_bytes(second);
}

} // namespace crypto
