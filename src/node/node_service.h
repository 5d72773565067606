#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// NodeService -- everything the merge pipeline asks of the node and wallet
//
// The pipeline never talks JSON-RPC directly. RpcNodeService implements
// this against a Bitcoin Core compatible node; the test suite implements it
// with an in-memory fake.
// ---------------------------------------------------------------------------

#ifndef TXCOMBINE_NODE_NODE_SERVICE_H
#define TXCOMBINE_NODE_NODE_SERVICE_H

#include "core/error.h"
#include "core/types.h"
#include "primitives/amount.h"
#include "primitives/fees.h"
#include "primitives/transaction.h"

#include <cstdint>
#include <map>
#include <vector>

namespace node {

/// A transaction as returned by getrawtransaction in verbose mode.
struct RawTransactionInfo {
    primitives::Transaction tx;
    /// 0 while the transaction is unconfirmed.
    int64_t confirmations = 0;
};

/// The part of a mempool entry this tool reads.
struct MempoolEntry {
    /// Fee after any prioritisetransaction adjustment.
    primitives::Amount modified_fee;
};

/// Unconfirmed descendants of a transaction, keyed by txid.
using DescendantMap = std::map<core::uint256, MempoolEntry>;

/// Result of fundrawtransaction.
struct FundedTransaction {
    primitives::Transaction tx;
    primitives::Amount fee;
    /// Index of the change output the wallet added, -1 for none.
    int64_t change_position = -1;
};

/// Result of signrawtransactionwithwallet.
struct SignedTransaction {
    primitives::Transaction tx;
    bool complete = false;
};

struct NetworkInfo {
    /// Minimum relay feerate (the node's relayfee, per 1000 bytes).
    primitives::FeeRate relay_fee;
};

class NodeService {
public:
    virtual ~NodeService() = default;

    /// Succeeds when the wallet knows @p txid; NOT_IN_WALLET otherwise.
    virtual core::Result<void> get_wallet_transaction(
        const core::uint256& txid) = 0;

    /// Decoded transaction plus its confirmation count.
    virtual core::Result<RawTransactionInfo> get_raw_transaction(
        const core::uint256& txid) = 0;

    /// True when the wallet owns @p script_pubkey. Scripts without an
    /// address form are never owned.
    virtual core::Result<bool> is_mine(
        const std::vector<uint8_t>& script_pubkey) = 0;

    /// MEMPOOL_ENTRY_UNAVAILABLE when @p txid is not in the mempool.
    virtual core::Result<MempoolEntry> get_mempool_entry(
        const core::uint256& txid) = 0;

    /// MEMPOOL_ENTRY_UNAVAILABLE when @p txid is not in the mempool.
    virtual core::Result<DescendantMap> get_descendants(
        const core::uint256& txid) = 0;

    /// Adds inputs and a change output. The change goes to
    /// @p change_script when it is non-empty, to a fresh wallet address
    /// otherwise. FUNDING_FAILED when the wallet cannot balance the
    /// transaction.
    virtual core::Result<FundedTransaction> fund_transaction(
        const primitives::Transaction& tx,
        const std::vector<uint8_t>& change_script) = 0;

    virtual core::Result<SignedTransaction> sign_transaction(
        const primitives::Transaction& tx) = 0;

    /// Broadcasts @p tx and returns the txid the node reports.
    virtual core::Result<core::uint256> send_transaction(
        const primitives::Transaction& tx) = 0;

    virtual core::Result<NetworkInfo> get_network_info() = 0;
};

} // namespace node

#endif // TXCOMBINE_NODE_NODE_SERVICE_H
