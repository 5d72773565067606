// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// combine-transactions -- merge two unconfirmed wallet transactions
//
// Builds one transaction that pays every recipient of both originals,
// conflicts with both, and outbids them and their descendants. Talks to a
// Bitcoin Core compatible node over JSON-RPC.
//
// Usage:
//   combine-transactions [options] <txid1> <txid2>
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "merge/combiner.h"
#include "merge/options.h"
#include "node/rpc_node_service.h"
#include "node/rpc_settings.h"
#include "rpc/client.h"
#include "rpc/http_client.h"

#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream& out) {
    out << "Usage: combine-transactions [options] <txid1> <txid2>\n\n"
        << "Replace two unconfirmed wallet transactions with one that pays\n"
        << "all of their recipients.\n\n"
        << "Options:\n"
        << "  -v                     Verbose (debug) logging\n"
        << "  -t                     Use testnet (RPC port 18332)\n"
        << "  -n                     Dry run: print the transaction hex\n"
        << "  -o                     Let the new transaction opt in to RBF\n"
        << "  -conf=<file>           Config file (default: <datadir>/bitcoin.conf)\n"
        << "  -datadir=<dir>         Node data directory (default: ~/.bitcoin)\n"
        << "  -rpcconnect=<host>     Node RPC host (default: 127.0.0.1)\n"
        << "  -rpcport=<port>        Node RPC port (default: 8332, testnet 18332)\n"
        << "  -rpcuser=<user>        RPC user name\n"
        << "  -rpcpassword=<pw>      RPC password (default: use the cookie file)\n"
        << "  -rpccookiefile=<file>  RPC cookie (default: <datadir>/.cookie)\n"
        << "  -rpcwallet=<name>      Wallet to use on a multi-wallet node\n"
        << "  -rpcclienttimeout=<s>  RPC timeout in seconds, 0 for none (default: 900)\n"
        << "  -debuglogfile=<file>   Also append log lines to <file>\n"
        << "  -h, -help              Show this help\n";
}

int fail(const core::Error& err) {
    if (core::is_internal_fault(err.code())) {
        std::cerr << "error: internal error: " << err.message() << std::endl;
    } else {
        std::cerr << "error: " << err.message() << std::endl;
    }
    return 1;
}

} // namespace

// ===========================================================================
// Main
// ===========================================================================
int main(int argc, char* argv[]) {
    core::Config config;
    auto loaded = merge::load_config(config, argc, argv);
    if (!loaded.ok()) {
        return fail(loaded.error());
    }

    auto command_line = merge::command_line_from_config(config);
    if (!command_line.ok()) {
        print_usage(std::cerr);
        return fail(command_line.error());
    }
    const merge::CommandLine& cmd = command_line.value();
    if (cmd.help) {
        print_usage(std::cout);
        return 0;
    }

    core::Logger logger(std::cerr);
    if (cmd.verbose) {
        logger.set_level(core::LogLevel::DEBUG);
    }
    if (cmd.debug_log_file.has_value() &&
        !logger.set_log_file(*cmd.debug_log_file)) {
        return fail(core::Error(core::ErrorCode::CONFIG_ERROR,
                                "cannot open log file " + *cmd.debug_log_file));
    }

    auto settings = node::rpc_settings_from_config(config);
    if (!settings.ok()) {
        return fail(settings.error());
    }
    LOG_DEBUG(logger, core::LogCategory::CONFIG,
              "node at " + settings.value().http.host + ":" +
                  std::to_string(settings.value().http.port) + ", network " +
                  config.network());

    rpc::HttpClient transport(settings.value().http);
    rpc::RpcClient client(transport, logger, settings.value().wallet);
    node::RpcNodeService node(client, logger);

    merge::Combiner combiner(node, logger, cmd.combine);
    auto outcome = combiner.run(cmd.txid1, cmd.txid2);
    if (!outcome.ok()) {
        return fail(outcome.error());
    }

    // Hex on a dry run, the new txid otherwise.
    std::cout << outcome.value().output << std::endl;
    return 0;
}
