#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <compare>
#include <cstdint>
#include <string>

#include "core/error.h"
#include "core/serialize.h"

namespace primitives {

/// A monetary amount in satoshis. Signed: fee deltas and a change output
/// driven below zero during fee adjustment are both representable.
class Amount {
    int64_t value_ = 0;

public:
    /// Satoshis per bitcoin.
    static constexpr int64_t COIN = 100'000'000;

    /// Maximum total supply in satoshis (21 million coins).
    static constexpr int64_t MAX_MONEY = 21'000'000 * COIN;

    constexpr Amount() = default;
    constexpr explicit Amount(int64_t v) : value_(v) {}

    /// Convert a floating-point BTC value (as carried by RPC replies) to
    /// satoshis, rounding to the nearest unit. Rejects non-finite input and
    /// magnitudes above MAX_MONEY.
    static core::Result<Amount> from_btc(double btc);

    [[nodiscard]] constexpr int64_t value() const { return value_; }

    /// True when the value lies in [0, MAX_MONEY].
    [[nodiscard]] constexpr bool is_valid() const {
        return value_ >= 0 && value_ <= MAX_MONEY;
    }

    /// Decimal BTC string with trailing zeros trimmed, keeping at least one
    /// fractional digit: 12345 -> "0.00012345", COIN -> "1.0".
    [[nodiscard]] std::string to_string() const;

    constexpr Amount operator+(Amount o) const { return Amount(value_ + o.value_); }
    constexpr Amount operator-(Amount o) const { return Amount(value_ - o.value_); }
    constexpr Amount operator-() const { return Amount(-value_); }
    Amount& operator+=(Amount o) { value_ += o.value_; return *this; }
    Amount& operator-=(Amount o) { value_ -= o.value_; return *this; }

    constexpr bool operator==(const Amount& o) const = default;
    constexpr auto operator<=>(const Amount& o) const = default;

    /// Serialize the amount as a signed 64-bit little-endian integer.
    template<typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_i64(s, value_);
    }

    template<typename Stream>
    static Amount deserialize(Stream& s) {
        return Amount(core::ser_read_i64(s));
    }
};

} // namespace primitives
