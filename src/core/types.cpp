// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include "core/hex.h"

#include <algorithm>
#include <cstring>

namespace core {

namespace {

// Decodes exactly SIZE bytes of hex, in the order they appear.
Result<std::array<uint8_t, uint256::SIZE>> decode_exact(std::string_view hex) {
    if (hex.size() != uint256::SIZE * 2) {
        return Error(ErrorCode::PARSE_BAD_FORMAT,
                     "expected " + std::to_string(uint256::SIZE * 2) +
                     " hex characters, got " + std::to_string(hex.size()));
    }
    auto decoded = core::from_hex(hex);
    if (!decoded) {
        return Error(ErrorCode::PARSE_BAD_FORMAT, "invalid hex character");
    }
    std::array<uint8_t, uint256::SIZE> out{};
    std::copy(decoded->begin(), decoded->end(), out.begin());
    return out;
}

}  // namespace

uint256 uint256::from_bytes(std::span<const uint8_t, SIZE> bytes) noexcept {
    uint256 result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

Result<uint256> uint256::from_hex(std::string_view hex) {
    TXCOMBINE_TRY_ASSIGN(be, decode_exact(hex));
    uint256 result;
    std::reverse_copy(be.begin(), be.end(), result.bytes_.begin());
    return result;
}

Result<uint256> uint256::from_hex_le(std::string_view hex) {
    TXCOMBINE_TRY_ASSIGN(le, decode_exact(hex));
    return from_bytes(le);
}

std::string uint256::to_hex() const {
    std::array<uint8_t, SIZE> be{};
    std::reverse_copy(bytes_.begin(), bytes_.end(), be.begin());
    return core::to_hex(be);
}

std::string uint256::to_hex_le() const {
    return core::to_hex(bytes_);
}

bool uint256::is_zero() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0; });
}

std::strong_ordering uint256::operator<=>(
    const uint256& other) const noexcept {
    for (std::size_t i = SIZE; i > 0; --i) {
        if (bytes_[i - 1] != other.bytes_[i - 1]) {
            return bytes_[i - 1] < other.bytes_[i - 1]
                       ? std::strong_ordering::less
                       : std::strong_ordering::greater;
        }
    }
    return std::strong_ordering::equal;
}

}  // namespace core

std::size_t std::hash<core::uint256>::operator()(
    const core::uint256& v) const noexcept {
    // Ids are hash outputs already; the first word is uniformly distributed.
    std::size_t out = 0;
    std::memcpy(&out, v.data(), sizeof(out));
    return out;
}
