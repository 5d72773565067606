#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_NODE_RPC_NODE_SERVICE_H
#define TXCOMBINE_NODE_RPC_NODE_SERVICE_H

#include "core/logging.h"
#include "node/node_service.h"
#include "rpc/client.h"
#include "rpc/json.h"

#include <string>
#include <vector>

namespace node {

/// Parse a mempool entry object, preferring "fees.modified" and falling
/// back to the pre-0.21 "modifiedfee" field.
[[nodiscard]] core::Result<MempoolEntry> mempool_entry_from_json(
    const rpc::JsonValue& entry);

// ---------------------------------------------------------------------------
// RpcNodeService -- NodeService over a node's JSON-RPC interface
// ---------------------------------------------------------------------------
//   get_wallet_transaction  gettransaction
//   get_raw_transaction     getrawtransaction <id> true
//   is_mine                 decodescript + getaddressinfo
//   get_mempool_entry       getmempoolentry
//   get_descendants         getdescendants <id> true
//   fund_transaction        fundrawtransaction (changeAddress option)
//   sign_transaction        signrawtransactionwithwallet
//   send_transaction        sendrawtransaction
//   get_network_info        getnetworkinfo
// ---------------------------------------------------------------------------
class RpcNodeService final : public NodeService {
public:
    RpcNodeService(rpc::RpcClient& client, core::Logger& logger)
        : client_(client), logger_(logger) {}

    core::Result<void> get_wallet_transaction(
        const core::uint256& txid) override;
    core::Result<RawTransactionInfo> get_raw_transaction(
        const core::uint256& txid) override;
    core::Result<bool> is_mine(
        const std::vector<uint8_t>& script_pubkey) override;
    core::Result<MempoolEntry> get_mempool_entry(
        const core::uint256& txid) override;
    core::Result<DescendantMap> get_descendants(
        const core::uint256& txid) override;
    core::Result<FundedTransaction> fund_transaction(
        const primitives::Transaction& tx,
        const std::vector<uint8_t>& change_script) override;
    core::Result<SignedTransaction> sign_transaction(
        const primitives::Transaction& tx) override;
    core::Result<core::uint256> send_transaction(
        const primitives::Transaction& tx) override;
    core::Result<NetworkInfo> get_network_info() override;

private:
    /// The script's address via decodescript; empty when it has none.
    core::Result<std::string> script_address(
        const std::vector<uint8_t>& script_pubkey);

    rpc::RpcClient& client_;
    core::Logger&   logger_;
};

} // namespace node

#endif // TXCOMBINE_NODE_RPC_NODE_SERVICE_H
