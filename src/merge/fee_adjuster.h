#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_MERGE_FEE_ADJUSTER_H
#define TXCOMBINE_MERGE_FEE_ADJUSTER_H

#include "core/error.h"
#include "core/logging.h"
#include "merge/builder.h"
#include "merge/fee_accountant.h"
#include "node/node_service.h"
#include "primitives/amount.h"
#include "primitives/fees.h"

#include <cstddef>

namespace merge {

// ---------------------------------------------------------------------------
// FeePlan -- how much comes out of the change output, and why
// ---------------------------------------------------------------------------
struct FeePlan {
    /// Taken from change to cover everything evicted: required_fee() + 1 -
    /// fee. The tracked fee only rises to required_fee(); the extra
    /// satoshi is margin for the feerate comparison that follows.
    primitives::Amount eviction_top_up;
    /// Raise to reach min_fee_rate at the replacement's size.
    primitives::Amount feerate_top_up;
    /// Relay bandwidth for the replacement itself.
    primitives::Amount relay_fee;

    /// Fee the later steps compare against.
    primitives::Amount fee;
    /// Fee the transaction actually pays: funded fee plus every deduction.
    primitives::Amount paid_fee;
    primitives::Amount change;
};

/// Relay cost of @p size bytes at @p min_relay, rounded down.
[[nodiscard]] primitives::Amount relay_bandwidth_fee(
    size_t size, const primitives::FeeRate& min_relay);

/// Pure fee arithmetic. Starting from the funded @p fee and @p change
/// amount of a @p size byte replacement, applies in order the eviction
/// top-up, the feerate top-up and the relay fee, each taken out of the
/// change and added to the fee. The result may leave change <= 0.
[[nodiscard]] FeePlan plan_fee_adjustment(primitives::Amount fee,
                                          primitives::Amount change,
                                          size_t size,
                                          const FeeSummary& fees,
                                          const primitives::FeeRate& min_relay);

/// Applies plan_fee_adjustment() to @p built using the node's relay fee
/// and re-signs. INSUFFICIENT_CHANGE_FOR_FEE when the change output would
/// not stay positive; SIGNING_INCOMPLETE as for build_replacement().
[[nodiscard]] core::Result<BuiltReplacement> adjust_fees(
    node::NodeService& node, const BuiltReplacement& built,
    const FeeSummary& fees, core::Logger& logger);

} // namespace merge

#endif // TXCOMBINE_MERGE_FEE_ADJUSTER_H
