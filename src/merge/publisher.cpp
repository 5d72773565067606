// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "merge/publisher.h"

#include <string>

namespace merge {

core::Result<void> verify_conflicts(const primitives::Transaction& replacement,
                                    const primitives::Transaction& tx1,
                                    const primitives::Transaction& tx2) {
    const auto& vin = replacement.vin();
    if (vin.size() < 2 || tx1.vin().empty() || tx2.vin().empty()) {
        return core::Error(core::ErrorCode::CONFLICT_INVARIANT_VIOLATED,
                           "replacement has " + std::to_string(vin.size()) +
                               " inputs; it cannot conflict with both "
                               "originals");
    }
    if (vin[0].prevout != tx1.vin()[0].prevout) {
        return core::Error(core::ErrorCode::CONFLICT_INVARIANT_VIOLATED,
                           "first input " + vin[0].prevout.to_string() +
                               " does not conflict with txid1 (expected " +
                               tx1.vin()[0].prevout.to_string() + ")");
    }
    if (vin[1].prevout != tx2.vin()[0].prevout) {
        return core::Error(core::ErrorCode::CONFLICT_INVARIANT_VIOLATED,
                           "second input " + vin[1].prevout.to_string() +
                               " does not conflict with txid2 (expected " +
                               tx2.vin()[0].prevout.to_string() + ")");
    }
    return core::make_ok();
}

core::Result<Publication> publish(node::NodeService& node,
                                  const primitives::Transaction& replacement,
                                  bool dry_run, core::Logger& logger) {
    Publication result;
    if (dry_run) {
        LOG_INFO(logger, core::LogCategory::BUILD,
                 "dry run, not broadcasting");
        result.output = replacement.to_hex();
        return result;
    }

    TXCOMBINE_TRY_ASSIGN(local_txid, replacement.txid());
    TXCOMBINE_TRY_ASSIGN(node_txid, node.send_transaction(replacement));
    if (node_txid != local_txid) {
        LOG_WARN(logger, core::LogCategory::RPC,
                 "node reported txid " + node_txid.to_hex() +
                     ", computed " + local_txid.to_hex());
    }

    result.broadcast = true;
    result.output = node_txid.to_hex();
    return result;
}

} // namespace merge
