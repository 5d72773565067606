#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <string>

#include "core/serialize.h"
#include "core/types.h"

namespace primitives {

/// Identifies one output of a previous transaction: its txid and the
/// output's index within that transaction.
struct OutPoint {
    core::uint256 txid;
    uint32_t n = 0xFFFFFFFF;

    OutPoint() = default;
    OutPoint(const core::uint256& txid_in, uint32_t n_in)
        : txid(txid_in), n(n_in) {}

    bool operator==(const OutPoint&) const = default;

    /// "<txid display hex>:<index>".
    [[nodiscard]] std::string to_string() const {
        return txid.to_hex() + ":" + std::to_string(n);
    }

    /// 32-byte txid (internal order) followed by a 32-bit LE index.
    template<typename Stream>
    void serialize(Stream& s) const {
        core::ser_write_uint256(s, txid);
        core::ser_write_u32(s, n);
    }

    template<typename Stream>
    static OutPoint deserialize(Stream& s) {
        OutPoint op;
        op.txid = core::ser_read_uint256(s);
        op.n = core::ser_read_u32(s);
        return op;
    }
};

} // namespace primitives
