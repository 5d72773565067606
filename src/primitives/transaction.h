#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "core/types.h"
#include "primitives/amount.h"
#include "primitives/outpoint.h"
#include "primitives/txin.h"
#include "primitives/txout.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace primitives {

// ---------------------------------------------------------------------------
// Transaction -- immutable transaction value
// ---------------------------------------------------------------------------
// There are no mutating accessors. Every edit (new input list, new outputs,
// rewritten sequences, a changed output amount) returns a fresh value and
// leaves the original untouched, so each stage of the merge pipeline hands
// the next one a value it cannot disturb.
//
// Serialization follows BIP144: the marker/flag form is used whenever any
// input carries witness data.
// ---------------------------------------------------------------------------
class Transaction {
public:
    Transaction() = default;

    Transaction(std::vector<TxInput> vin, std::vector<TxOutput> vout,
                int32_t version = 2, uint32_t locktime = 0);

    // -- Const accessors ----------------------------------------------------

    [[nodiscard]] int32_t version() const { return version_; }
    [[nodiscard]] const std::vector<TxInput>& vin() const { return vin_; }
    [[nodiscard]] const std::vector<TxOutput>& vout() const { return vout_; }
    [[nodiscard]] uint32_t locktime() const { return locktime_; }

    // -- Derived values -----------------------------------------------------

    /// Copy with @p vin as the input list.
    [[nodiscard]] Transaction with_inputs(std::vector<TxInput> vin) const;

    /// Copy with @p vout as the output list.
    [[nodiscard]] Transaction with_outputs(std::vector<TxOutput> vout) const;

    /// Copy with every input's sequence number set to @p sequence.
    [[nodiscard]] Transaction with_sequences(uint32_t sequence) const;

    /// Copy with output @p index carrying @p amount. Returns
    /// INTERNAL_ERROR when the index is out of range.
    [[nodiscard]] core::Result<Transaction> with_output_amount(
        size_t index, Amount amount) const;

    // -- Properties ---------------------------------------------------------

    /// True if any input carries witness data.
    [[nodiscard]] bool has_witness() const;

    /// True if every input signals BIP125 replaceability (and there is at
    /// least one input).
    [[nodiscard]] bool all_inputs_signal_rbf() const;

    /// Transaction id: SHA-256d of the non-witness serialization.
    [[nodiscard]] core::Result<core::uint256> txid() const;

    // -- Sizes --------------------------------------------------------------

    /// Size of the full serialization (including witness) in bytes. This is
    /// the size every feerate in this project is measured against.
    [[nodiscard]] size_t total_size() const;

    // -- Serialization ------------------------------------------------------

    [[nodiscard]] std::vector<uint8_t> serialize() const;
    [[nodiscard]] std::vector<uint8_t> serialize_no_witness() const;

    /// Lowercase hex of serialize().
    [[nodiscard]] std::string to_hex() const;

    template <typename Stream>
    void serialize_to(Stream& s, bool allow_witness = true) const;

    /// Decode a BIP144 (or legacy) serialization. Trailing bytes, an
    /// unknown flag and an empty witness section are all rejected.
    [[nodiscard]] static core::Result<Transaction> deserialize(
        std::span<const uint8_t> bytes);

    /// deserialize() over a hex string.
    [[nodiscard]] static core::Result<Transaction> from_hex(
        std::string_view hex);

    bool operator==(const Transaction&) const = default;

private:
    int32_t version_ = 2;
    std::vector<TxInput> vin_;
    std::vector<TxOutput> vout_;
    uint32_t locktime_ = 0;
};

// =========================================================================
// Template implementations
// =========================================================================

template <typename Stream>
void Transaction::serialize_to(Stream& s, bool allow_witness) const {
    const bool use_witness = allow_witness && has_witness();

    core::ser_write_i32(s, version_);
    if (use_witness) {
        // BIP144 marker + flag
        core::ser_write_u8(s, 0x00);
        core::ser_write_u8(s, 0x01);
    }

    core::ser_write_compact_size(s, vin_.size());
    for (const auto& input : vin_) {
        input.serialize(s);
    }

    core::ser_write_compact_size(s, vout_.size());
    for (const auto& output : vout_) {
        output.serialize(s);
    }

    if (use_witness) {
        for (const auto& input : vin_) {
            core::ser_write_compact_size(s, input.witness.size());
            for (const auto& item : input.witness) {
                core::ser_write_vector(s, item);
            }
        }
    }

    core::ser_write_u32(s, locktime_);
}

} // namespace primitives
