// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the core and crypto modules.

#include "test_framework.h"

#include "core/config.h"
#include "core/error.h"
#include "core/hex.h"
#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "core/types.h"
#include "crypto/sha256.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

const std::string TXID_HEX =
    "00000000000000000007a4e02e4a058662db0e67e8d2074b592603ed0db7ae53";

/// Writes @p contents to a fresh file under the temp directory.
std::filesystem::path write_temp_file(const std::string& name,
                                      const std::string& contents) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << contents;
    return path;
}

} // namespace

// ============================================================================
// Types -- uint256
// ============================================================================

TEST_CASE(Types, uint256_default_is_zero) {
    core::uint256 z;
    CHECK(z.is_zero());
    CHECK_EQ(z.to_hex(), std::string(64, '0'));
}

TEST_CASE(Types, uint256_from_hex_roundtrip) {
    auto val = core::uint256::from_hex(TXID_HEX);
    CHECK_OK(val);
    CHECK(!val.value().is_zero());
    CHECK_EQ(val.value().to_hex(), TXID_HEX);
}

TEST_CASE(Types, uint256_display_order_is_reversed) {
    auto val = core::uint256::from_hex(TXID_HEX);
    CHECK_OK(val);
    CHECK_EQ(val.value().to_hex_le(),
             std::string("53aeb70ded0326594b07d2e8670edb62"
                         "86054a2ee0a407000000000000000000"));
    // Display "...53" is stored first.
    CHECK_EQ(val.value().data()[0], static_cast<uint8_t>(0x53));

    auto le = core::uint256::from_hex_le(val.value().to_hex_le());
    CHECK_OK(le);
    CHECK(le.value() == val.value());
}

TEST_CASE(Types, uint256_rejects_wrong_length) {
    CHECK_ERR_CODE(core::uint256::from_hex(TXID_HEX.substr(2)),
                   core::ErrorCode::PARSE_BAD_FORMAT);
    CHECK_ERR_CODE(core::uint256::from_hex(TXID_HEX + "00"),
                   core::ErrorCode::PARSE_BAD_FORMAT);
    CHECK_ERR_CODE(core::uint256::from_hex(""),
                   core::ErrorCode::PARSE_BAD_FORMAT);
}

TEST_CASE(Types, uint256_rejects_non_hex) {
    std::string bad = TXID_HEX;
    bad[10] = 'g';
    CHECK_ERR_CODE(core::uint256::from_hex(bad),
                   core::ErrorCode::PARSE_BAD_FORMAT);
}

TEST_CASE(Types, uint256_comparison) {
    auto a = core::uint256::from_hex(std::string(63, '0') + "1").value();
    auto b = core::uint256::from_hex(std::string(63, '0') + "2").value();
    auto c = core::uint256::from_hex("1" + std::string(63, '0')).value();

    CHECK(a != b);
    CHECK(a < b);
    CHECK(b < c);
    CHECK(c > a);
}

// ============================================================================
// Hex
// ============================================================================

TEST_CASE(Hex, to_hex_basic) {
    std::vector<uint8_t> data{0x00, 0x0f, 0xab, 0xff};
    CHECK_EQ(core::to_hex(data), std::string("000fabff"));
    CHECK_EQ(core::to_hex(std::vector<uint8_t>{}), std::string());
}

TEST_CASE(Hex, from_hex_valid) {
    auto bytes = core::from_hex("DEADbeef");
    CHECK(bytes.has_value());
    CHECK_EQ(*bytes, (std::vector<uint8_t>{0xde, 0xad, 0xbe, 0xef}));
}

TEST_CASE(Hex, from_hex_invalid) {
    CHECK(!core::from_hex("abc").has_value());
    CHECK(!core::from_hex("zz").has_value());
    CHECK(core::from_hex("").has_value());
}

// ============================================================================
// ErrorResult
// ============================================================================

TEST_CASE(ErrorResult, error_creation) {
    core::Error err(core::ErrorCode::NOT_IN_WALLET, "unknown tx");
    CHECK(!err.is_ok());
    CHECK(err.code() == core::ErrorCode::NOT_IN_WALLET);
    CHECK_EQ(err.message(), std::string("unknown tx"));
    CHECK(test::contains(err.format(), "NOT_IN_WALLET(501): unknown tx"));
    // Raised here, so the location names this file.
    CHECK(test::contains(err.format(), "test_core.cpp:"));
}

namespace {

core::Result<int> parse_positive(int v) {
    if (v <= 0) return core::Error(core::ErrorCode::PARSE_ERROR, "negative");
    return v;
}

core::Result<int> sum_positive(int a, int b) {
    TXCOMBINE_TRY_ASSIGN(x, parse_positive(a));
    TXCOMBINE_TRY_ASSIGN(y, parse_positive(b));
    return x + y;
}

} // namespace

TEST_CASE(ErrorResult, try_assign_propagates) {
    CHECK_EQ(sum_positive(2, 3).value(), 5);
    CHECK_ERR_CODE(sum_positive(2, -3), core::ErrorCode::PARSE_ERROR);
}

TEST_CASE(ErrorResult, internal_fault_classification) {
    CHECK(core::is_internal_fault(core::ErrorCode::CONFLICT_INVARIANT_VIOLATED));
    CHECK(core::is_internal_fault(core::ErrorCode::INTERNAL_ERROR));
    CHECK(!core::is_internal_fault(core::ErrorCode::NOT_REPLACEABLE));
    CHECK(!core::is_internal_fault(core::ErrorCode::INSUFFICIENT_CHANGE_FOR_FEE));
    CHECK_EQ(core::error_code_name(core::ErrorCode::ALREADY_CONFIRMED),
             std::string_view("ALREADY_CONFIRMED"));
}

// ============================================================================
// Stream / Serialize
// ============================================================================

TEST_CASE(Stream, compact_size_encodings) {
    core::DataStream s;
    core::ser_write_compact_size(s, 0xfc);
    core::ser_write_compact_size(s, 0xfd);
    core::ser_write_compact_size(s, 0x10000);
    CHECK_EQ(core::to_hex(s.bytes()), std::string("fcfdfd00fe00000100"));

    CHECK_EQ(core::ser_read_compact_size(s), static_cast<uint64_t>(0xfc));
    CHECK_EQ(core::ser_read_compact_size(s), static_cast<uint64_t>(0xfd));
    CHECK_EQ(core::ser_read_compact_size(s), static_cast<uint64_t>(0x10000));
    CHECK(s.eof());
}

TEST_CASE(Stream, non_canonical_compact_size_throws) {
    std::vector<uint8_t> raw{0xfd, 0x10, 0x00};
    core::DataStream s(raw);
    bool threw = false;
    try {
        (void)core::ser_read_compact_size(s);
    } catch (const std::exception&) {
        threw = true;
    }
    CHECK(threw);
}

TEST_CASE(Stream, read_past_end_throws) {
    std::vector<uint8_t> raw{0x01, 0x02};
    core::DataStream s(raw);
    bool threw = false;
    try {
        (void)core::ser_read_u32(s);
    } catch (const std::exception&) {
        threw = true;
    }
    CHECK(threw);
}

TEST_CASE(Stream, size_counter_matches_stream) {
    core::DataStream s;
    core::SizeCounter counter;
    std::vector<uint8_t> payload(300, 0xaa);
    core::ser_write_vector(s, payload);
    core::ser_write_vector(counter, payload);
    CHECK_EQ(counter.size(), s.size());
    CHECK_EQ(s.size(), static_cast<size_t>(303));
}

// ============================================================================
// Crypto
// ============================================================================

TEST_CASE(Crypto, sha256_abc) {
    const std::string msg = "abc";
    auto digest = crypto::sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(msg.data()), msg.size()));
    CHECK_OK(digest);
    CHECK_EQ(core::to_hex(digest.value()),
             std::string("ba7816bf8f01cfea414140de5dae2223"
                         "b00361a396177a9cb410ff61f20015ad"));
}

TEST_CASE(Crypto, sha256d_empty) {
    auto hash = crypto::sha256d(std::span<const uint8_t>());
    CHECK_OK(hash);
    CHECK_EQ(hash.value().to_hex_le(),
             std::string("5df6e0e2761359d30a8275058e299fcc"
                         "0381534545f55cf43e41983f5d4c9456"));
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE(Config, parse_args_options_and_positionals) {
    const char* argv[] = {"prog", "-rpcport=18443", "--rpcuser=alice",
                          "-v", TXID_HEX.c_str(), "second"};
    core::Config cfg;
    CHECK_OK(cfg.parse_args(6, argv));
    CHECK_EQ(cfg.get_int(core::CONF_RPCPORT, 0).value(),
             static_cast<int64_t>(18443));
    CHECK_EQ(cfg.get_or(core::CONF_RPCUSER, ""), std::string("alice"));
    CHECK(cfg.get_bool("v"));
    CHECK_EQ(cfg.positionals().size(), static_cast<size_t>(2));
    CHECK_EQ(cfg.positionals()[1], std::string("second"));
}

TEST_CASE(Config, bundled_short_flags) {
    const char* argv[] = {"prog", "-vn", "-vx"};
    core::Config cfg;
    CHECK_OK(cfg.parse_args(3, argv, "vtnoh"));
    CHECK(cfg.get_bool("v"));
    CHECK(cfg.get_bool("n"));
    CHECK(!cfg.get_bool("o"));
    // "x" is not a short flag, so "-vx" is one long option.
    CHECK(cfg.get_bool("vx"));
}

TEST_CASE(Config, cli_keys_sorted_and_exclude_file_values) {
    auto path = write_temp_file("txcombine_test_keys.conf", "rpcwallet=w\n");
    const char* argv[] = {"prog", "-rpcport=1", "-n", "pos"};
    core::Config cfg;
    CHECK_OK(cfg.parse_args(4, argv, "n"));
    CHECK_OK(cfg.parse_file(path, "main"));
    CHECK_EQ(cfg.cli_keys(),
             (std::vector<std::string>{"n", "rpcport"}));
    std::filesystem::remove(path);
}

TEST_CASE(Config, double_dash_ends_options) {
    const char* argv[] = {"prog", "--", "-n"};
    core::Config cfg;
    CHECK_OK(cfg.parse_args(3, argv, "n"));
    CHECK(!cfg.has("n"));
    CHECK_EQ(cfg.positionals().size(), static_cast<size_t>(1));
}

TEST_CASE(Config, malformed_option_rejected) {
    const char* argv[] = {"prog", "-=5"};
    core::Config cfg;
    CHECK_ERR_CODE(cfg.parse_args(2, argv), core::ErrorCode::CONFIG_ERROR);
}

TEST_CASE(Config, file_sections_and_cli_priority) {
    auto path = write_temp_file("txcombine_test_sections.conf",
        "rpcuser=fileuser  # comment\n"
        "rpcpassword=filepw\n"
        "[test]\n"
        "rpcport=18332\n"
        "[main]\n"
        "rpcport=8332\n");

    const char* argv[] = {"prog", "-rpcuser=cliuser"};
    core::Config cfg;
    CHECK_OK(cfg.parse_args(2, argv));
    CHECK_OK(cfg.parse_file(path, "test"));

    CHECK_EQ(cfg.get_or(core::CONF_RPCUSER, ""), std::string("cliuser"));
    CHECK_EQ(cfg.get_or(core::CONF_RPCPASSWORD, ""), std::string("filepw"));
    CHECK_EQ(cfg.get_int(core::CONF_RPCPORT, 0).value(),
             static_cast<int64_t>(18332));
    std::filesystem::remove(path);
}

TEST_CASE(Config, missing_file_and_bad_lines) {
    core::Config cfg;
    CHECK_ERR_CODE(cfg.parse_file("/nonexistent/txcombine.conf", "main"),
                   core::ErrorCode::CONFIG_MISSING);

    auto path = write_temp_file("txcombine_test_bad.conf", "=value\n");
    CHECK_ERR_CODE(cfg.parse_file(path, "main"),
                   core::ErrorCode::CONFIG_ERROR);
    std::filesystem::remove(path);
}

TEST_CASE(Config, get_int_rejects_garbage) {
    const char* argv[] = {"prog", "-rpcport=80x"};
    core::Config cfg;
    CHECK_OK(cfg.parse_args(2, argv));
    CHECK_ERR_CODE(cfg.get_int(core::CONF_RPCPORT, 8332),
                   core::ErrorCode::CONFIG_ERROR);
}

TEST_CASE(Config, network_and_data_dir) {
    core::Config cfg;
    CHECK_EQ(cfg.network(), std::string("main"));
    cfg.set(core::CONF_TESTNET, "1");
    CHECK_EQ(cfg.network(), std::string("test"));
    cfg.set(core::CONF_DATADIR, "/srv/bitcoin");
    CHECK(cfg.data_dir() == std::filesystem::path("/srv/bitcoin"));
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE(Logging, level_filtering) {
    std::ostringstream sink;
    core::Logger logger(sink);

    LOG_DEBUG(logger, core::LogCategory::FEES, "hidden");
    CHECK(sink.str().empty());

    LOG_WARN(logger, core::LogCategory::RPC, "shown");
    CHECK(test::contains(sink.str(), "[WARN] [RPC] shown"));

    logger.set_level(core::LogLevel::DEBUG);
    LOG_DEBUG(logger, core::LogCategory::FEES, "now visible");
    CHECK(test::contains(sink.str(), "[DEBUG] [FEES] now visible"));
}

TEST_CASE(Logging, off_silences_everything) {
    std::ostringstream sink;
    core::Logger logger(sink);
    CHECK(!logger.will_log(core::LogLevel::INFO, core::LogCategory::RPC));
    CHECK(logger.will_log(core::LogLevel::WARN, core::LogCategory::NONE));

    logger.set_level(core::LogLevel::OFF);
    CHECK(!logger.will_log(core::LogLevel::ERR, core::LogCategory::RPC));
    LOG_WARN(logger, core::LogCategory::MEMPOOL, "dropped");
    CHECK(sink.str().empty());
}

TEST_CASE(Logging, message_not_built_when_filtered) {
    std::ostringstream sink;
    core::Logger logger(sink);
    int evaluations = 0;
    auto message = [&] { ++evaluations; return std::string("x"); };

    LOG_TRACE(logger, core::LogCategory::BUILD, message());
    CHECK_EQ(evaluations, 0);
    LOG_WARN(logger, core::LogCategory::BUILD, message());
    CHECK_EQ(evaluations, 1);
}

TEST_CASE(Logging, file_output) {
    auto path = std::filesystem::temp_directory_path() /
                "txcombine_test_log.txt";
    std::filesystem::remove(path);

    std::ostringstream sink;
    {
        core::Logger logger(sink);
        CHECK(logger.set_log_file(path));
        LOG_WARN(logger, core::LogCategory::CONFIG, "to both sinks");
    }
    CHECK(test::contains(sink.str(), "[WARN] [CONFIG] to both sinks"));

    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    CHECK(test::contains(line, "[WARN] [CONFIG] to both sinks"));
    std::filesystem::remove(path);
}
