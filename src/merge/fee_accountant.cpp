// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "merge/fee_accountant.h"

#include <algorithm>
#include <string>
#include <utility>

namespace merge {

core::Result<FeeSummary> account_fees(node::NodeService& node,
                                      const CandidatePair& candidates,
                                      core::Logger& logger) {
    const Candidate& c1 = candidates.first;
    const Candidate& c2 = candidates.second;

    TXCOMBINE_TRY_ASSIGN(entry1, node.get_mempool_entry(c1.txid));
    TXCOMBINE_TRY_ASSIGN(entry2, node.get_mempool_entry(c2.txid));

    FeeSummary summary;
    summary.fee1 = entry1.modified_fee;
    summary.fee2 = entry2.modified_fee;
    summary.size1 = c1.tx.total_size();
    summary.size2 = c2.tx.total_size();
    summary.old_fees = summary.fee1 + summary.fee2;
    summary.old_feerate = primitives::FeeRate(summary.old_fees,
                                              summary.size1 + summary.size2);

    LOG_DEBUG(logger, core::LogCategory::FEES,
              "original fees " + summary.fee1.to_string() + " + " +
                  summary.fee2.to_string() + " = " +
                  summary.old_fees.to_string() + " BTC");

    TXCOMBINE_TRY_ASSIGN(desc1, node.get_descendants(c1.txid));
    TXCOMBINE_TRY_ASSIGN(desc2, node.get_descendants(c2.txid));

    summary.descendants = std::move(desc1);
    for (const auto& [id, entry] : desc2) {
        summary.descendants[id] = entry;
    }
    for (const auto& [id, entry] : summary.descendants) {
        summary.descendant_fees += entry.modified_fee;
    }

    LOG_DEBUG(logger, core::LogCategory::MEMPOOL,
              std::to_string(summary.descendants.size()) +
                  " descendants paying " +
                  summary.descendant_fees.to_string() + " BTC");

    summary.min_fee_rate =
        std::max(primitives::FeeRate(summary.fee1, summary.size1),
                 primitives::FeeRate(summary.fee2, summary.size2));
    return summary;
}

} // namespace merge
