#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/stream.h"
#include "core/types.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

namespace core {

/// Maximum element count accepted for a deserialized vector or script.
inline constexpr size_t MAX_VECTOR_SIZE = 1u << 22;

/// Maximum value accepted by ser_read_compact_size (2^32 - 1).
inline constexpr uint64_t MAX_COMPACT_SIZE = 0xFFFFFFFFULL;

// ===================================================================
// CompactSize encoding
// ===================================================================
//   0   .. 252              -> 1 byte   (value itself)
//   253 .. 0xFFFF           -> 0xFD + 2 bytes LE
//   0x10000 .. 0xFFFF'FFFF  -> 0xFE + 4 bytes LE
//   larger                  -> 0xFF + 8 bytes LE
// ===================================================================

namespace detail {

template <typename Stream>
inline void write_le(Stream& s, uint64_t v, int width) {
    uint8_t buf[8];
    for (int i = 0; i < width; ++i) {
        buf[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    s.write(std::span<const uint8_t>(buf, static_cast<size_t>(width)));
}

template <typename Stream>
inline uint64_t read_le(Stream& s, int width) {
    uint8_t buf[8];
    s.read(std::span<uint8_t>(buf, static_cast<size_t>(width)));
    uint64_t v = 0;
    for (int i = 0; i < width; ++i) {
        v |= static_cast<uint64_t>(buf[i]) << (8 * i);
    }
    return v;
}

}  // namespace detail

template <typename Stream>
void ser_write_compact_size(Stream& s, uint64_t n) {
    if (n < 253) {
        detail::write_le(s, n, 1);
    } else if (n <= 0xFFFF) {
        detail::write_le(s, 0xFD, 1);
        detail::write_le(s, n, 2);
    } else if (n <= 0xFFFFFFFFULL) {
        detail::write_le(s, 0xFE, 1);
        detail::write_le(s, n, 4);
    } else {
        detail::write_le(s, 0xFF, 1);
        detail::write_le(s, n, 8);
    }
}

/// Read a CompactSize-encoded unsigned integer.
/// Throws on non-canonical encoding or values exceeding MAX_COMPACT_SIZE.
template <typename Stream>
uint64_t ser_read_compact_size(Stream& s) {
    const uint64_t hdr = detail::read_le(s, 1);
    uint64_t n = 0;
    uint64_t min = 0;
    if (hdr < 253) {
        return hdr;
    } else if (hdr == 0xFD) {
        n = detail::read_le(s, 2);
        min = 253;
    } else if (hdr == 0xFE) {
        n = detail::read_le(s, 4);
        min = 0x10000ULL;
    } else {
        n = detail::read_le(s, 8);
        min = 0x100000000ULL;
    }
    if (n < min) {
        throw std::runtime_error(
            "ser_read_compact_size(): non-canonical encoding");
    }
    if (n > MAX_COMPACT_SIZE) {
        throw std::runtime_error(
            "ser_read_compact_size(): size exceeds MAX_COMPACT_SIZE");
    }
    return n;
}

// ===================================================================
// Fixed-width integers, little-endian wire format
// ===================================================================

template <typename Stream>
inline void ser_write_u8(Stream& s, uint8_t v) { detail::write_le(s, v, 1); }

template <typename Stream>
inline void ser_write_u32(Stream& s, uint32_t v) { detail::write_le(s, v, 4); }

template <typename Stream>
inline void ser_write_i32(Stream& s, int32_t v) {
    detail::write_le(s, static_cast<uint32_t>(v), 4);
}

template <typename Stream>
inline void ser_write_i64(Stream& s, int64_t v) {
    detail::write_le(s, static_cast<uint64_t>(v), 8);
}

template <typename Stream>
inline uint8_t ser_read_u8(Stream& s) {
    return static_cast<uint8_t>(detail::read_le(s, 1));
}

template <typename Stream>
inline uint32_t ser_read_u32(Stream& s) {
    return static_cast<uint32_t>(detail::read_le(s, 4));
}

template <typename Stream>
inline int32_t ser_read_i32(Stream& s) {
    return static_cast<int32_t>(ser_read_u32(s));
}

template <typename Stream>
inline int64_t ser_read_i64(Stream& s) {
    return static_cast<int64_t>(detail::read_le(s, 8));
}

// ===================================================================
// Byte vectors and 256-bit ids
// ===================================================================

/// Write a byte vector: CompactSize length prefix followed by raw bytes.
template <typename Stream>
void ser_write_vector(Stream& s, const std::vector<uint8_t>& v) {
    ser_write_compact_size(s, v.size());
    s.write(std::span<const uint8_t>(v.data(), v.size()));
}

/// Read a byte vector. Throws if the length exceeds MAX_VECTOR_SIZE.
template <typename Stream>
std::vector<uint8_t> ser_read_vector(Stream& s) {
    const uint64_t len = ser_read_compact_size(s);
    if (len > MAX_VECTOR_SIZE) {
        throw std::runtime_error(
            "ser_read_vector(): vector exceeds MAX_VECTOR_SIZE");
    }
    std::vector<uint8_t> v(static_cast<size_t>(len));
    s.read(std::span<uint8_t>(v.data(), v.size()));
    return v;
}

/// uint256 is written in its internal (little-endian) byte order.
template <typename Stream>
void ser_write_uint256(Stream& s, const uint256& v) {
    s.write(std::span<const uint8_t>(v.data(), v.size()));
}

template <typename Stream>
uint256 ser_read_uint256(Stream& s) {
    std::array<uint8_t, uint256::SIZE> buf{};
    s.read(std::span<uint8_t>(buf.data(), buf.size()));
    return uint256::from_bytes(buf);
}

}  // namespace core
