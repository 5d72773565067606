#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_NODE_RPC_SETTINGS_H
#define TXCOMBINE_NODE_RPC_SETTINGS_H

#include "core/config.h"
#include "core/error.h"
#include "rpc/http_client.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace node {

inline constexpr uint16_t MAINNET_RPC_PORT = 8332;
inline constexpr uint16_t TESTNET_RPC_PORT = 18332;
inline constexpr int64_t  DEFAULT_RPC_CLIENT_TIMEOUT = 900;

/// Everything needed to reach the node, resolved from configuration.
struct RpcSettings {
    rpc::HttpClientOptions http;
    /// Wallet to route wallet calls to; empty for the default wallet.
    std::string wallet;
};

/// Directory holding the network's cookie file: the data directory itself
/// on mainnet, its "testnet3" subdirectory on testnet.
[[nodiscard]] std::filesystem::path network_data_dir(
    const core::Config& config);

/// Resolve host, port, credentials, wallet and timeout from @p config.
/// Credentials come from rpcuser/rpcpassword when rpcpassword is set,
/// otherwise from the cookie file. CONFIG_ERROR when the port or timeout
/// is malformed; CONFIG_MISSING when no password is configured and the
/// cookie file cannot be read.
[[nodiscard]] core::Result<RpcSettings> rpc_settings_from_config(
    const core::Config& config);

/// Read "<user>:<password>" from a node cookie file.
[[nodiscard]] core::Result<std::string> read_cookie(
    const std::filesystem::path& path);

} // namespace node

#endif // TXCOMBINE_NODE_RPC_SETTINGS_H
