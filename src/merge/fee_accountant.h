#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_MERGE_FEE_ACCOUNTANT_H
#define TXCOMBINE_MERGE_FEE_ACCOUNTANT_H

#include "core/error.h"
#include "core/logging.h"
#include "merge/validator.h"
#include "node/node_service.h"
#include "primitives/amount.h"
#include "primitives/fees.h"

#include <cstddef>

namespace merge {

// ---------------------------------------------------------------------------
// FeeSummary -- what the replacement has to outbid
// ---------------------------------------------------------------------------
struct FeeSummary {
    /// Modified fees of the two originals.
    primitives::Amount fee1;
    primitives::Amount fee2;
    /// Serialized sizes of the two originals.
    size_t size1 = 0;
    size_t size2 = 0;

    primitives::Amount   old_fees;
    primitives::FeeRate  old_feerate;

    /// Union of both descendant sets; an id present in both counts once.
    node::DescendantMap  descendants;
    primitives::Amount   descendant_fees;

    /// max(fee1/size1, fee2/size2)
    primitives::FeeRate  min_fee_rate;

    /// Absolute fee the replacement must reach: everything it evicts.
    [[nodiscard]] primitives::Amount required_fee() const {
        return old_fees + descendant_fees;
    }
};

/// Gathers modified fees and descendants of both candidates from the
/// mempool. MEMPOOL_ENTRY_UNAVAILABLE when either has left it.
[[nodiscard]] core::Result<FeeSummary> account_fees(
    node::NodeService& node, const CandidatePair& candidates,
    core::Logger& logger);

} // namespace merge

#endif // TXCOMBINE_MERGE_FEE_ACCOUNTANT_H
