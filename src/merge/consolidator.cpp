// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "merge/consolidator.h"

#include "core/hex.h"

#include <initializer_list>
#include <string>

namespace merge {

core::Result<Consolidation> consolidate_outputs(
    node::NodeService& node, const primitives::Transaction& tx1,
    const primitives::Transaction& tx2, core::Logger& logger) {
    Consolidation result;

    for (const auto* tx : {&tx1, &tx2}) {
        for (const auto& out : tx->vout()) {
            TXCOMBINE_TRY_ASSIGN(mine, node.is_mine(out.script_pubkey));
            if (mine && result.change.add(out.script_pubkey)) {
                LOG_DEBUG(logger, core::LogCategory::WALLET,
                          "change output script " +
                              core::to_hex(out.script_pubkey));
            }
            if (result.outputs.add(out.script_pubkey, out.amount)) {
                LOG_DEBUG(logger, core::LogCategory::BUILD,
                          "duplicate output script, consolidating " +
                              core::to_hex(out.script_pubkey));
            }
        }
    }

    if (result.change.size() > 1) {
        LOG_DEBUG(logger, core::LogCategory::WALLET,
                  std::to_string(result.change.size()) +
                      " wallet-owned outputs; only the first absorbs fees");
    }
    return result;
}

std::vector<primitives::TxOutput> payee_outputs(
    const Consolidation& consolidation) {
    std::vector<primitives::TxOutput> payees;
    payees.reserve(consolidation.outputs.size());
    for (const auto& entry : consolidation.outputs.entries()) {
        if (consolidation.change.contains(entry.script)) continue;
        payees.emplace_back(entry.amount, entry.script);
    }
    return payees;
}

} // namespace merge
