#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

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
// uint256 -- 32-byte identifier (transaction ids)
// ---------------------------------------------------------------------------
// Bytes are stored in LITTLE-ENDIAN order internally, which is the order
// they take on the wire and inside a hash digest. The conventional display
// form (RPC arguments, block explorers) is the byte-reversed, BIG-ENDIAN
// hex string.
// ---------------------------------------------------------------------------
class uint256 {
public:
    static constexpr std::size_t SIZE = 32;

    /// Default: zero-initialized.
    constexpr uint256() noexcept : bytes_{} {}

    /// Construct from raw internal-order (little-endian) bytes.
    static uint256 from_bytes(std::span<const uint8_t, SIZE> bytes) noexcept;

    /// Parse the big-endian display form. Exactly 64 hex characters.
    static Result<uint256> from_hex(std::string_view hex);

    /// Parse the little-endian internal form. Exactly 64 hex characters.
    static Result<uint256> from_hex_le(std::string_view hex);

    /// Big-endian display hex (64 lowercase chars).
    [[nodiscard]] std::string to_hex() const;

    /// Little-endian internal-order hex (64 lowercase chars).
    [[nodiscard]] std::string to_hex_le() const;

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }
    [[nodiscard]] const std::array<uint8_t, SIZE>& bytes() const noexcept {
        return bytes_;
    }
    [[nodiscard]] constexpr std::size_t size() const noexcept { return SIZE; }

    [[nodiscard]] bool is_zero() const noexcept;

    // Numeric ordering, most-significant (last stored) byte first.
    [[nodiscard]] std::strong_ordering operator<=>(
        const uint256& other) const noexcept;
    [[nodiscard]] bool operator==(const uint256& other) const noexcept {
        return bytes_ == other.bytes_;
    }

private:
    std::array<uint8_t, SIZE> bytes_;
};

}  // namespace core

template <>
struct std::hash<core::uint256> {
    std::size_t operator()(const core::uint256& v) const noexcept;
};
