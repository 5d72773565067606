// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/amount.h"

#include <cmath>
#include <cstdio>

namespace primitives {

core::Result<Amount> Amount::from_btc(double btc) {
    if (!std::isfinite(btc)) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
                                "BTC amount is not finite");
    }

    // Multiply first, then round to the nearest satoshi.
    const double raw = btc * static_cast<double>(COIN);
    if (std::fabs(raw) > static_cast<double>(MAX_MONEY)) {
        return core::make_error(core::ErrorCode::PARSE_OVERFLOW,
                                "BTC amount out of range");
    }
    return Amount(static_cast<int64_t>(std::llround(raw)));
}

std::string Amount::to_string() const {
    const bool negative = value_ < 0;
    const uint64_t magnitude = negative
        ? static_cast<uint64_t>(-(value_ + 1)) + 1
        : static_cast<uint64_t>(value_);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%s%llu.%08llu", negative ? "-" : "",
                  static_cast<unsigned long long>(magnitude / COIN),
                  static_cast<unsigned long long>(magnitude % COIN));

    std::string out(buf);
    while (out.back() == '0') out.pop_back();
    if (out.back() == '.') out.push_back('0');
    return out;
}

} // namespace primitives
