#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <utility>
#include <vector>

#include "core/serialize.h"
#include "primitives/amount.h"

namespace primitives {

/// A transaction output: an amount and the locking script. Scripts are
/// opaque here; two outputs pay the same destination exactly when their
/// script bytes are equal.
struct TxOutput {
    Amount amount;
    std::vector<uint8_t> script_pubkey;

    TxOutput() = default;
    TxOutput(Amount amount_in, std::vector<uint8_t> script_in)
        : amount(amount_in), script_pubkey(std::move(script_in)) {}

    bool operator==(const TxOutput&) const = default;

    /// amount (8) | compact_size(script) | script bytes
    template<typename Stream>
    void serialize(Stream& s) const {
        amount.serialize(s);
        core::ser_write_vector(s, script_pubkey);
    }

    template<typename Stream>
    static TxOutput deserialize(Stream& s) {
        TxOutput output;
        output.amount = Amount::deserialize(s);
        output.script_pubkey = core::ser_read_vector(s);
        return output;
    }
};

} // namespace primitives
