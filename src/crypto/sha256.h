#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/types.h"

#include <array>
#include <cstdint>
#include <span>

namespace crypto {

using Sha256Digest = std::array<uint8_t, 32>;

/// Single SHA-256 over @p data, computed with OpenSSL EVP.
[[nodiscard]] core::Result<Sha256Digest> sha256(
    std::span<const uint8_t> data);

/// SHA-256 applied twice. The digest bytes become the uint256 in their
/// natural order, so a transaction id displays byte-reversed.
[[nodiscard]] core::Result<core::uint256> sha256d(
    std::span<const uint8_t> data);

} // namespace crypto
