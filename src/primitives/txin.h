#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <utility>
#include <vector>

#include "core/serialize.h"
#include "primitives/outpoint.h"

namespace primitives {

/// A transaction input: the output it spends, the unlocking script, the
/// sequence number and (for segwit spends) the witness stack.
struct TxInput {
    /// Final input: no relative lock-time, no replacement signal.
    static constexpr uint32_t SEQUENCE_FINAL = 0xFFFFFFFF;

    /// Highest sequence that still allows a non-final locktime without
    /// signalling replaceability (BIP125 opt-out value).
    static constexpr uint32_t SEQUENCE_NO_RBF = 0xFFFFFFFE;

    OutPoint prevout;
    std::vector<uint8_t> script_sig;
    uint32_t sequence = SEQUENCE_FINAL;
    std::vector<std::vector<uint8_t>> witness;

    TxInput() = default;
    TxInput(OutPoint prevout_in, std::vector<uint8_t> script_sig_in,
            uint32_t sequence_in = SEQUENCE_FINAL)
        : prevout(std::move(prevout_in)),
          script_sig(std::move(script_sig_in)),
          sequence(sequence_in) {}

    /// BIP125: an input whose sequence is below 0xFFFFFFFE opts in to
    /// replace-by-fee.
    [[nodiscard]] bool signals_rbf() const {
        return sequence < SEQUENCE_NO_RBF;
    }

    [[nodiscard]] bool has_witness() const { return !witness.empty(); }

    bool operator==(const TxInput&) const = default;

    /// Base input without witness; witnesses are written at the
    /// transaction level.
    ///   prevout (36) | compact_size(script_sig) | script_sig | sequence (4)
    template<typename Stream>
    void serialize(Stream& s) const {
        prevout.serialize(s);
        core::ser_write_vector(s, script_sig);
        core::ser_write_u32(s, sequence);
    }

    template<typename Stream>
    static TxInput deserialize(Stream& s) {
        TxInput input;
        input.prevout = OutPoint::deserialize(s);
        input.script_sig = core::ser_read_vector(s);
        input.sequence = core::ser_read_u32(s);
        return input;
    }
};

} // namespace primitives
