// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "merge/options.h"

#include <algorithm>
#include <array>
#include <filesystem>
#include <string>
#include <string_view>

namespace merge {

namespace {

constexpr std::array<std::string_view, 17> KNOWN_OPTIONS = {
    "v", "t", "n", "o", "h", "help",
    core::CONF_CONF, core::CONF_DATADIR, core::CONF_TESTNET,
    core::CONF_RPCCONNECT, core::CONF_RPCPORT, core::CONF_RPCUSER,
    core::CONF_RPCPASSWORD, core::CONF_RPCCOOKIEFILE, core::CONF_RPCWALLET,
    core::CONF_RPCCLIENTTIMEOUT, core::CONF_DEBUGLOGFILE,
};

core::Result<void> check_known_options(const core::Config& config) {
    for (const std::string& key : config.cli_keys()) {
        if (std::find(KNOWN_OPTIONS.begin(), KNOWN_OPTIONS.end(), key) ==
            KNOWN_OPTIONS.end()) {
            return core::Error(core::ErrorCode::CONFIG_ERROR,
                               "unknown option -" + key);
        }
    }
    return core::make_ok();
}

bool wants_testnet(const core::Config& config) {
    return config.get_bool("t") || config.get_bool(core::CONF_TESTNET);
}

} // namespace

core::Result<void> load_config(core::Config& config, int argc,
                               const char* const argv[]) {
    TXCOMBINE_TRY_VOID(config.parse_args(argc, argv, SHORT_FLAGS));
    TXCOMBINE_TRY_VOID(check_known_options(config));

    const bool testnet = wants_testnet(config);

    auto explicit_conf = config.get(core::CONF_CONF);
    std::filesystem::path conf_path = explicit_conf.has_value()
        ? std::filesystem::path{*explicit_conf}
        : config.data_dir() / "bitcoin.conf";

    auto parsed = config.parse_file(conf_path, testnet ? "test" : "main");
    if (!parsed.ok()) {
        // The default config file is optional.
        if (explicit_conf.has_value() ||
            parsed.error().code() != core::ErrorCode::CONFIG_MISSING) {
            return parsed.error();
        }
    }

    if (testnet) {
        config.set(core::CONF_TESTNET, "1");
    }
    return core::make_ok();
}

core::Result<CommandLine> command_line_from_config(const core::Config& config) {
    CommandLine cmd;
    cmd.help = config.get_bool("h") || config.get_bool("help");
    if (cmd.help) {
        return cmd;
    }

    const auto& positionals = config.positionals();
    if (positionals.size() != 2) {
        return core::Error(core::ErrorCode::CONFIG_ERROR,
                           "expected two transaction ids, got " +
                               std::to_string(positionals.size()));
    }
    cmd.txid1 = positionals[0];
    cmd.txid2 = positionals[1];

    cmd.verbose = config.get_bool("v");
    cmd.testnet = wants_testnet(config);
    cmd.combine.dry_run = config.get_bool("n");
    cmd.combine.opt_in = config.get_bool("o");
    cmd.debug_log_file = config.get(core::CONF_DEBUGLOGFILE);
    return cmd;
}

} // namespace merge
