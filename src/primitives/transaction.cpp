// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/transaction.h"

#include "core/hex.h"
#include "crypto/sha256.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace primitives {

// =========================================================================
// Construction
// =========================================================================

Transaction::Transaction(std::vector<TxInput> vin,
                         std::vector<TxOutput> vout,
                         int32_t version,
                         uint32_t locktime)
    : version_(version)
    , vin_(std::move(vin))
    , vout_(std::move(vout))
    , locktime_(locktime) {}

// =========================================================================
// Derived values
// =========================================================================

Transaction Transaction::with_inputs(std::vector<TxInput> vin) const {
    return Transaction(std::move(vin), vout_, version_, locktime_);
}

Transaction Transaction::with_outputs(std::vector<TxOutput> vout) const {
    return Transaction(vin_, std::move(vout), version_, locktime_);
}

Transaction Transaction::with_sequences(uint32_t sequence) const {
    std::vector<TxInput> vin = vin_;
    for (auto& input : vin) {
        input.sequence = sequence;
    }
    return with_inputs(std::move(vin));
}

core::Result<Transaction> Transaction::with_output_amount(
    size_t index, Amount amount) const {
    if (index >= vout_.size()) {
        return core::Error(core::ErrorCode::INTERNAL_ERROR,
                           "output index " + std::to_string(index) +
                           " out of range (" + std::to_string(vout_.size()) +
                           " outputs)");
    }
    std::vector<TxOutput> vout = vout_;
    vout[index].amount = amount;
    return with_outputs(std::move(vout));
}

// =========================================================================
// Properties
// =========================================================================

bool Transaction::has_witness() const {
    return std::any_of(vin_.begin(), vin_.end(),
                       [](const TxInput& in) { return in.has_witness(); });
}

bool Transaction::all_inputs_signal_rbf() const {
    return !vin_.empty() &&
           std::all_of(vin_.begin(), vin_.end(),
                       [](const TxInput& in) { return in.signals_rbf(); });
}

core::Result<core::uint256> Transaction::txid() const {
    return crypto::sha256d(serialize_no_witness());
}

size_t Transaction::total_size() const {
    core::SizeCounter counter;
    serialize_to(counter);
    return counter.size();
}

// =========================================================================
// Serialization
// =========================================================================

std::vector<uint8_t> Transaction::serialize() const {
    core::DataStream s;
    serialize_to(s);
    return s.release();
}

std::vector<uint8_t> Transaction::serialize_no_witness() const {
    core::DataStream s;
    serialize_to(s, false);
    return s.release();
}

std::string Transaction::to_hex() const {
    return core::to_hex(serialize());
}

core::Result<Transaction> Transaction::deserialize(
    std::span<const uint8_t> bytes) {
    core::DataStream s(bytes);
    Transaction tx;
    try {
        tx.version_ = core::ser_read_i32(s);

        // An empty input list is how BIP144 encodes its marker byte; the
        // flag byte that follows selects the extended format.
        uint8_t flags = 0;
        uint64_t vin_count = core::ser_read_compact_size(s);
        if (vin_count == 0) {
            flags = core::ser_read_u8(s);
            if (flags != 0) {
                vin_count = core::ser_read_compact_size(s);
            }
        }
        if (vin_count > core::MAX_VECTOR_SIZE) {
            return core::Error(core::ErrorCode::PARSE_OVERFLOW,
                               "too many inputs");
        }
        for (uint64_t i = 0; i < vin_count; ++i) {
            tx.vin_.push_back(TxInput::deserialize(s));
        }

        uint64_t vout_count = core::ser_read_compact_size(s);
        if (vout_count > core::MAX_VECTOR_SIZE) {
            return core::Error(core::ErrorCode::PARSE_OVERFLOW,
                               "too many outputs");
        }
        for (uint64_t i = 0; i < vout_count; ++i) {
            tx.vout_.push_back(TxOutput::deserialize(s));
        }

        if (flags & 0x01) {
            flags ^= 0x01;
            for (auto& input : tx.vin_) {
                const uint64_t items = core::ser_read_compact_size(s);
                for (uint64_t j = 0; j < items; ++j) {
                    input.witness.push_back(core::ser_read_vector(s));
                }
            }
            if (!tx.has_witness()) {
                return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                                   "superfluous witness record");
            }
        }
        if (flags != 0) {
            return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                               "unknown transaction optional data");
        }

        tx.locktime_ = core::ser_read_u32(s);
    } catch (const std::runtime_error& e) {
        return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
                           std::string("transaction decode failed: ") +
                           e.what());
    }

    if (!s.eof()) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           std::to_string(s.remaining()) +
                           " trailing bytes after transaction");
    }
    return tx;
}

core::Result<Transaction> Transaction::from_hex(std::string_view hex) {
    auto bytes = core::from_hex(hex);
    if (!bytes) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT,
                           "transaction is not valid hex");
    }
    return deserialize(*bytes);
}

} // namespace primitives
