// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for amounts, fee rates and transactions.

#include "test_framework.h"
#include "test_util.h"

#include "core/hex.h"
#include "crypto/sha256.h"
#include "primitives/amount.h"
#include "primitives/fees.h"
#include "primitives/transaction.h"

#include <limits>
#include <string>
#include <vector>

using primitives::Amount;
using primitives::FeeRate;
using primitives::Transaction;

// ============================================================================
// Amount
// ============================================================================

TEST_CASE(Amount, to_string_trims_zeros) {
    CHECK_EQ(Amount(12345).to_string(), std::string("0.00012345"));
    CHECK_EQ(Amount(Amount::COIN).to_string(), std::string("1.0"));
    CHECK_EQ(Amount(0).to_string(), std::string("0.0"));
    CHECK_EQ(Amount(150000000).to_string(), std::string("1.5"));
    CHECK_EQ(Amount(-2500).to_string(), std::string("-0.000025"));
}

TEST_CASE(Amount, from_btc_rounds_to_satoshi) {
    CHECK_EQ(Amount::from_btc(0.00012345).value(), Amount(12345));
    CHECK_EQ(Amount::from_btc(0.1).value(), Amount(10000000));
    CHECK_EQ(Amount::from_btc(-0.0001).value(), Amount(-10000));
    CHECK_EQ(Amount::from_btc(20999999.97690000).value(),
             Amount(2099999997690000));
}

TEST_CASE(Amount, from_btc_rejects_out_of_range) {
    CHECK_ERR_CODE(Amount::from_btc(21000001.0),
                   core::ErrorCode::PARSE_OVERFLOW);
    CHECK_ERR(Amount::from_btc(std::numeric_limits<double>::quiet_NaN()));
}

TEST_CASE(Amount, arithmetic_and_ordering) {
    Amount a(3000);
    a += Amount(500);
    a -= Amount(1000);
    CHECK_EQ(a, Amount(2500));
    CHECK(Amount(1) < Amount(2));
    CHECK_EQ(-Amount(5), Amount(-5));
    CHECK(!Amount(-1).is_valid());
    CHECK(Amount(Amount::MAX_MONEY).is_valid());
}

// ============================================================================
// FeeRate
// ============================================================================

TEST_CASE(FeeRate, exact_ratio_comparison) {
    // 1000/300 vs 1001/301: 1000 * 301 > 1001 * 300.
    FeeRate a(Amount(1000), 300);
    FeeRate b(Amount(1001), 301);
    CHECK(a > b);
    CHECK(FeeRate(Amount(10), 5) == FeeRate(Amount(20), 10));
    CHECK(FeeRate(Amount(0), 100) < FeeRate(Amount(1), 1000000));
}

TEST_CASE(FeeRate, compute_fee_rounds_up) {
    FeeRate rate(Amount(1000), 300);
    // 1000 * 250 / 300 = 833.33...
    CHECK_EQ(rate.compute_fee(250), Amount(834));
    CHECK_EQ(rate.compute_fee(300), Amount(1000));
    CHECK(FeeRate(rate.compute_fee(251), 251) >= rate);
}

TEST_CASE(FeeRate, per_kb_and_string) {
    FeeRate rate = FeeRate::from_per_kb(Amount(1000));
    CHECK_EQ(rate.per_kb(), Amount(1000));
    CHECK_EQ(rate.compute_fee(250), Amount(250));
    CHECK_EQ(FeeRate(Amount(1234), 226).per_kb(), Amount(5460));
    CHECK_EQ(rate.to_string(), std::string("0.00001 BTC/kB"));
}

TEST_CASE(FeeRate, zero_size_treated_as_one_byte) {
    FeeRate rate(Amount(7), 0);
    CHECK_EQ(rate.size(), static_cast<size_t>(1));
    CHECK_EQ(rate.compute_fee(3), Amount(21));
}

// ============================================================================
// Transaction
// ============================================================================

namespace {

Transaction sample_tx() {
    return testutil::tx({testutil::input(0x11, 1), testutil::input(0x22, 0)},
                        {testutil::output(5000, 0xa1),
                         testutil::output(3000, 0xb2)});
}

} // namespace

TEST_CASE(Transaction, legacy_roundtrip_and_sizes) {
    Transaction t = sample_tx();
    CHECK(!t.has_witness());
    // version 4 | n_in 1 | 2 * (36 + 1 + 107 + 4) | n_out 1 |
    // 2 * (8 + 1 + 22) | locktime 4
    CHECK_EQ(t.total_size(), static_cast<size_t>(4 + 1 + 296 + 1 + 62 + 4));
    CHECK_EQ(t.serialize_no_witness().size(), t.total_size());

    auto decoded = Transaction::from_hex(t.to_hex());
    CHECK_OK(decoded);
    CHECK(decoded.value() == t);
}

TEST_CASE(Transaction, witness_roundtrip) {
    auto in = testutil::input(0x33, 2);
    in.script_sig.clear();
    in.witness = {std::vector<uint8_t>(72, 0x30), std::vector<uint8_t>(33, 0x02)};
    Transaction t = testutil::tx({in}, {testutil::output(1000, 0xa1)});

    CHECK(t.has_witness());
    CHECK(t.total_size() > t.serialize_no_witness().size());
    // BIP144 marker and flag follow the version.
    CHECK_EQ(t.to_hex().substr(8, 4), std::string("0001"));

    auto decoded = Transaction::deserialize(t.serialize());
    CHECK_OK(decoded);
    CHECK(decoded.value() == t);
}

TEST_CASE(Transaction, txid_ignores_witness) {
    auto in = testutil::input(0x33, 2);
    Transaction plain = testutil::tx({in}, {testutil::output(1000, 0xa1)});
    in.witness = {std::vector<uint8_t>(64, 0x01)};
    Transaction with_witness = testutil::tx({in}, {testutil::output(1000, 0xa1)});

    CHECK(plain.txid().value() == with_witness.txid().value());
    CHECK(plain.txid().value() ==
          crypto::sha256d(plain.serialize_no_witness()).value());
}

TEST_CASE(Transaction, rejects_trailing_and_truncated) {
    std::string hex = sample_tx().to_hex();
    CHECK_ERR_CODE(Transaction::from_hex(hex + "00"),
                   core::ErrorCode::PARSE_BAD_FORMAT);
    CHECK_ERR_CODE(Transaction::from_hex(hex.substr(0, hex.size() - 4)),
                   core::ErrorCode::PARSE_UNDERFLOW);
    CHECK_ERR(Transaction::from_hex("zz"));
}

TEST_CASE(Transaction, rejects_superfluous_witness_flag) {
    // version | marker 00 flag 01 | 1 input without witness | 0 outputs |
    // empty witness stack | locktime
    std::string hex = "02000000" "0001" "01" +
                      std::string(64, '1') + "00000000" "00" "fdffffff" +
                      "00" "00" "00000000";
    CHECK_ERR_CODE(Transaction::from_hex(hex),
                   core::ErrorCode::PARSE_BAD_FORMAT);
}

TEST_CASE(Transaction, immutable_edits) {
    Transaction t = sample_tx();

    Transaction seq = t.with_sequences(0);
    CHECK_EQ(seq.vin()[0].sequence, static_cast<uint32_t>(0));
    CHECK_EQ(seq.vin()[1].sequence, static_cast<uint32_t>(0));
    CHECK_EQ(t.vin()[0].sequence, testutil::SEQUENCE_RBF);

    auto paid = t.with_output_amount(1, Amount(2500));
    CHECK_OK(paid);
    CHECK_EQ(paid.value().vout()[1].amount, Amount(2500));
    CHECK_EQ(t.vout()[1].amount, Amount(3000));
    CHECK_ERR_CODE(t.with_output_amount(2, Amount(1)),
                   core::ErrorCode::INTERNAL_ERROR);

    Transaction fewer = t.with_inputs({t.vin()[1]});
    CHECK_EQ(fewer.vin().size(), static_cast<size_t>(1));
    CHECK_EQ(fewer.vout(), t.vout());
}

TEST_CASE(Transaction, replaceability_signals) {
    Transaction all = sample_tx();
    CHECK(all.all_inputs_signal_rbf());

    Transaction mixed = testutil::tx(
        {testutil::input(0x11, 1),
         testutil::input(0x22, 0, primitives::TxInput::SEQUENCE_NO_RBF)},
        {testutil::output(1, 0xa1)});
    CHECK(mixed.vin()[0].signals_rbf());
    CHECK(!mixed.all_inputs_signal_rbf());

    Transaction none = all.with_sequences(primitives::TxInput::SEQUENCE_FINAL);
    CHECK(!none.all_inputs_signal_rbf());
    CHECK(!none.vin()[0].signals_rbf());

    Transaction empty = testutil::tx({}, {testutil::output(1, 0xa1)});
    CHECK(!empty.all_inputs_signal_rbf());
}
