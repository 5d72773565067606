#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_MERGE_BUILDER_H
#define TXCOMBINE_MERGE_BUILDER_H

#include "core/error.h"
#include "core/logging.h"
#include "merge/consolidator.h"
#include "merge/fee_accountant.h"
#include "merge/validator.h"
#include "node/node_service.h"
#include "primitives/amount.h"
#include "primitives/transaction.h"

#include <cstddef>
#include <cstdint>

namespace merge {

/// Sequence for a replacement that may itself be replaced later.
inline constexpr uint32_t SEQUENCE_OPT_IN = 0;

/// A funded and signed replacement, before fee adjustment.
struct BuiltReplacement {
    primitives::Transaction tx;
    /// Fee as reported by funding (and raised by adjust_fees()).
    primitives::Amount      fee;
    size_t                  change_position = 0;
};

/// Unfunded replacement: tx1 with inputs [tx1.vin[0], tx2.vin[0]] (script
/// data stripped) and outputs @p payees.
///
/// An input that spends one of @p descendants is dropped: first the
/// second input is checked, and only if it is kept, the first. No other
/// dependency between the originals is detected.
[[nodiscard]] primitives::Transaction make_skeleton(
    const CandidatePair& candidates, const node::DescendantMap& descendants,
    std::vector<primitives::TxOutput> payees, core::Logger& logger);

/// Skeleton -> fundrawtransaction -> sequences -> signrawtransactionwithwallet.
///
/// Errors: FUNDING_FAILED, UNSUPPORTED_NO_CHANGE (the wallet added no
/// change output), SIGNING_INCOMPLETE.
[[nodiscard]] core::Result<BuiltReplacement> build_replacement(
    node::NodeService& node, const CandidatePair& candidates,
    const Consolidation& consolidation, const FeeSummary& fees,
    bool opt_in, core::Logger& logger);

/// Signs @p tx with the wallet; SIGNING_INCOMPLETE unless every input
/// ends up signed.
[[nodiscard]] core::Result<primitives::Transaction> sign_complete(
    node::NodeService& node, const primitives::Transaction& tx);

} // namespace merge

#endif // TXCOMBINE_MERGE_BUILDER_H
