#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/amount.h"

#include <compare>
#include <cstddef>
#include <string>

namespace primitives {

// ---------------------------------------------------------------------------
// FeeRate  --  fee paid per byte of serialized transaction
// ---------------------------------------------------------------------------
// Held as the exact ratio fee/size rather than a rounded per-kB figure, so
// that "feerate >= max(fee1/size1, fee2/size2)" is decided without any
// rounding. Ordering is by cross multiplication.
// ---------------------------------------------------------------------------
class FeeRate {
public:
    /// Zero fee rate.
    FeeRate() = default;

    /// Rate of @p fee over @p size bytes. A zero size is treated as one
    /// byte.
    FeeRate(Amount fee, size_t size);

    /// Rate given in satoshis per 1000 bytes (the node's relayfee unit).
    static FeeRate from_per_kb(Amount fee_per_kb) {
        return FeeRate(fee_per_kb, 1000);
    }

    [[nodiscard]] Amount fee() const { return fee_; }
    [[nodiscard]] size_t size() const { return size_; }

    /// Fee owed by a transaction of @p size bytes at this rate, rounded up
    /// so the result never falls below the rate.
    [[nodiscard]] Amount compute_fee(size_t size) const;

    /// Satoshis per 1000 bytes, truncated toward zero.
    [[nodiscard]] Amount per_kb() const;

    /// Human-readable representation: "<BTC> BTC/kB".
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] std::strong_ordering operator<=>(const FeeRate& other) const;
    [[nodiscard]] bool operator==(const FeeRate& other) const {
        return (*this <=> other) == std::strong_ordering::equal;
    }

private:
    Amount fee_{0};
    size_t size_ = 1;
};

} // namespace primitives
