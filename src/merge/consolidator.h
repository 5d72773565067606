#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_MERGE_CONSOLIDATOR_H
#define TXCOMBINE_MERGE_CONSOLIDATOR_H

#include "core/error.h"
#include "core/logging.h"
#include "merge/output_map.h"
#include "node/node_service.h"
#include "primitives/transaction.h"
#include "primitives/txout.h"

#include <vector>

namespace merge {

struct Consolidation {
    /// Every output of both transactions, amounts summed per script.
    OutputMap       outputs;
    /// The subset of scripts the wallet owns.
    ChangeOutputSet change;
};

/// Walks the outputs of @p tx1 then @p tx2, asking the node which scripts
/// belong to the wallet. Owned scripts still enter the output map; they
/// are filtered out later by payee_outputs().
[[nodiscard]] core::Result<Consolidation> consolidate_outputs(
    node::NodeService& node, const primitives::Transaction& tx1,
    const primitives::Transaction& tx2, core::Logger& logger);

/// Non-change outputs of @p consolidation, in map order.
[[nodiscard]] std::vector<primitives::TxOutput> payee_outputs(
    const Consolidation& consolidation);

} // namespace merge

#endif // TXCOMBINE_MERGE_CONSOLIDATOR_H
