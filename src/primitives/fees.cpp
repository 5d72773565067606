// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/fees.h"

namespace primitives {

namespace {

using Wide = __int128;

// Division rounding toward positive infinity; @p d must be positive.
Wide ceil_div(Wide n, Wide d) {
    Wide q = n / d;
    if (n % d != 0 && n > 0) ++q;
    return q;
}

} // namespace

FeeRate::FeeRate(Amount fee, size_t size)
    : fee_(fee), size_(size == 0 ? 1 : size) {}

Amount FeeRate::compute_fee(size_t size) const {
    const Wide n = static_cast<Wide>(fee_.value()) * static_cast<Wide>(size);
    return Amount(static_cast<int64_t>(ceil_div(n, static_cast<Wide>(size_))));
}

Amount FeeRate::per_kb() const {
    const Wide n = static_cast<Wide>(fee_.value()) * 1000;
    return Amount(static_cast<int64_t>(n / static_cast<Wide>(size_)));
}

std::string FeeRate::to_string() const {
    return per_kb().to_string() + " BTC/kB";
}

std::strong_ordering FeeRate::operator<=>(const FeeRate& other) const {
    // a/b <=> c/d  with positive b, d  ==  a*d <=> c*b
    const Wide lhs = static_cast<Wide>(fee_.value()) *
                     static_cast<Wide>(other.size_);
    const Wide rhs = static_cast<Wide>(other.fee_.value()) *
                     static_cast<Wide>(size_);
    if (lhs < rhs) return std::strong_ordering::less;
    if (lhs > rhs) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

} // namespace primitives
