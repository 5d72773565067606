#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_MERGE_PUBLISHER_H
#define TXCOMBINE_MERGE_PUBLISHER_H

#include "core/error.h"
#include "core/logging.h"
#include "node/node_service.h"
#include "primitives/transaction.h"

#include <string>

namespace merge {

/// The replacement must spend tx1.vin[0] as its first input and tx2.vin[0]
/// as its second, otherwise it would not evict both originals.
/// CONFLICT_INVARIANT_VIOLATED (an internal fault) when it does not.
///
/// Originals that spend each other can legitimately fail this check after
/// the skeleton dropped an input.
[[nodiscard]] core::Result<void> verify_conflicts(
    const primitives::Transaction& replacement,
    const primitives::Transaction& tx1, const primitives::Transaction& tx2);

struct Publication {
    bool        broadcast = false;
    /// Hex serialization on a dry run, the new txid otherwise.
    std::string output;
};

/// Dry run: returns the hex serialization and never touches the network.
/// Otherwise submits the replacement and returns the txid reported by the
/// node.
[[nodiscard]] core::Result<Publication> publish(
    node::NodeService& node, const primitives::Transaction& replacement,
    bool dry_run, core::Logger& logger);

} // namespace merge

#endif // TXCOMBINE_MERGE_PUBLISHER_H
