#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_MERGE_COMBINER_H
#define TXCOMBINE_MERGE_COMBINER_H

#include "core/error.h"
#include "core/logging.h"
#include "merge/fee_accountant.h"
#include "node/node_service.h"
#include "primitives/amount.h"
#include "primitives/transaction.h"

#include <string>
#include <string_view>

namespace merge {

struct CombineOptions {
    /// Print the signed replacement instead of broadcasting it.
    bool dry_run = false;
    /// Let the replacement itself be replaced (sequence 0). Off by default:
    /// combining it again later with a third transaction might not conflict
    /// with one of today's originals.
    bool opt_in = false;
};

struct CombineOutcome {
    primitives::Transaction tx;
    primitives::Amount      fee;
    FeeSummary              fees;
    bool                    broadcast = false;
    /// Hex on a dry run, txid otherwise.
    std::string             output;
};

// ---------------------------------------------------------------------------
// Combiner -- runs the whole merge for one pair of transactions
// ---------------------------------------------------------------------------
// validate -> consolidate -> account -> build -> adjust -> verify -> publish
//
// Stops at the first failing stage and returns its error. Nothing is
// broadcast unless every stage before publish succeeded.
// ---------------------------------------------------------------------------
class Combiner {
public:
    Combiner(node::NodeService& node, core::Logger& logger,
             CombineOptions options)
        : node_(node), logger_(logger), options_(options) {}

    [[nodiscard]] core::Result<CombineOutcome> run(std::string_view txid1,
                                                   std::string_view txid2);

private:
    void log_report(const FeeSummary& fees,
                    const primitives::Transaction& replacement,
                    primitives::Amount fee);

    node::NodeService& node_;
    core::Logger&      logger_;
    CombineOptions     options_;
};

} // namespace merge

#endif // TXCOMBINE_MERGE_COMBINER_H
