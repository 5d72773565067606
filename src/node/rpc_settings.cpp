// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/rpc_settings.h"

#include "rpc/util.h"

#include <fstream>
#include <string>

namespace node {

std::filesystem::path network_data_dir(const core::Config& config) {
    std::filesystem::path dir = config.data_dir();
    if (config.network() == "test") {
        dir /= "testnet3";
    }
    return dir;
}

core::Result<std::string> read_cookie(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return core::Error(core::ErrorCode::CONFIG_MISSING,
                           "cannot read RPC cookie file " + path.string() +
                               " (set -rpcpassword or -rpccookiefile)");
    }

    std::string line;
    std::getline(file, line);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    if (line.find(':') == std::string::npos) {
        return core::Error(core::ErrorCode::CONFIG_ERROR,
                           "malformed RPC cookie file " + path.string());
    }
    return line;
}

core::Result<RpcSettings> rpc_settings_from_config(
    const core::Config& config) {
    RpcSettings settings;
    settings.http.host = config.get_or(core::CONF_RPCCONNECT, "127.0.0.1");

    const int64_t default_port = config.network() == "test"
                                     ? TESTNET_RPC_PORT
                                     : MAINNET_RPC_PORT;
    TXCOMBINE_TRY_ASSIGN(port, config.get_int(core::CONF_RPCPORT,
                                              default_port));
    if (port <= 0 || port > 65535) {
        return core::Error(core::ErrorCode::CONFIG_ERROR,
                           "rpcport out of range: " + std::to_string(port));
    }
    settings.http.port = static_cast<uint16_t>(port);

    TXCOMBINE_TRY_ASSIGN(timeout, config.get_int(core::CONF_RPCCLIENTTIMEOUT,
                                                 DEFAULT_RPC_CLIENT_TIMEOUT));
    if (timeout < 0 || timeout > 86400 * 365) {
        return core::Error(core::ErrorCode::CONFIG_ERROR,
                           "rpcclienttimeout out of range: " +
                               std::to_string(timeout));
    }
    settings.http.timeout_seconds = static_cast<int>(timeout);

    auto password = config.get(core::CONF_RPCPASSWORD);
    if (password.has_value() && !password->empty()) {
        settings.http.authorization = rpc::basic_auth_header(
            config.get_or(core::CONF_RPCUSER, ""), *password);
    } else {
        std::filesystem::path cookie_path = network_data_dir(config) / ".cookie";
        auto custom = config.get(core::CONF_RPCCOOKIEFILE);
        if (custom.has_value() && !custom->empty()) {
            cookie_path = *custom;
        }
        TXCOMBINE_TRY_ASSIGN(cookie, read_cookie(cookie_path));
        auto colon = cookie.find(':');
        settings.http.authorization = rpc::basic_auth_header(
            std::string_view(cookie).substr(0, colon),
            std::string_view(cookie).substr(colon + 1));
    }

    settings.wallet = config.get_or(core::CONF_RPCWALLET, "");
    return settings;
}

} // namespace node
