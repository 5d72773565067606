// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "merge/fee_adjuster.h"

#include <string>
#include <utility>

namespace merge {

primitives::Amount relay_bandwidth_fee(size_t size,
                                       const primitives::FeeRate& min_relay) {
    const __int128 product = static_cast<__int128>(min_relay.fee().value()) *
                             static_cast<__int128>(size);
    return primitives::Amount(static_cast<int64_t>(
        product / static_cast<__int128>(min_relay.size())));
}

FeePlan plan_fee_adjustment(primitives::Amount fee, primitives::Amount change,
                            size_t size, const FeeSummary& fees,
                            const primitives::FeeRate& min_relay) {
    FeePlan plan;
    plan.fee = fee;
    plan.change = change;

    if (plan.fee < fees.required_fee()) {
        plan.eviction_top_up =
            fees.required_fee() + primitives::Amount(1) - plan.fee;
        plan.change -= plan.eviction_top_up;
        plan.fee = fees.required_fee();
    }

    if (primitives::FeeRate(plan.fee, size) < fees.min_fee_rate) {
        plan.feerate_top_up = fees.min_fee_rate.compute_fee(size) - plan.fee;
        plan.change -= plan.feerate_top_up;
        plan.fee += plan.feerate_top_up;
    }

    plan.relay_fee = relay_bandwidth_fee(size, min_relay);
    plan.change -= plan.relay_fee;
    plan.fee += plan.relay_fee;

    plan.paid_fee = fee + (change - plan.change);
    return plan;
}

core::Result<BuiltReplacement> adjust_fees(node::NodeService& node,
                                           const BuiltReplacement& built,
                                           const FeeSummary& fees,
                                           core::Logger& logger) {
    TXCOMBINE_TRY_ASSIGN(network, node.get_network_info());

    if (built.change_position >= built.tx.vout().size()) {
        return core::Error(core::ErrorCode::INTERNAL_ERROR,
                           "change position " +
                               std::to_string(built.change_position) +
                               " out of range");
    }

    const primitives::Amount change_before =
        built.tx.vout()[built.change_position].amount;

    // Signatures vary in length, so re-signing can grow the transaction.
    // The plan is redone once at the re-signed size.
    size_t size = built.tx.total_size();
    for (int attempt = 0; attempt < 2; ++attempt) {
        FeePlan plan = plan_fee_adjustment(built.fee, change_before, size,
                                           fees, network.relay_fee);

        LOG_DEBUG(logger, core::LogCategory::FEES,
                  "fee adjustment at " + std::to_string(size) +
                      " bytes: eviction +" + plan.eviction_top_up.to_string() +
                      ", feerate +" + plan.feerate_top_up.to_string() +
                      ", relay +" + plan.relay_fee.to_string() + " BTC");

        if (plan.change <= primitives::Amount(0)) {
            return core::Error(core::ErrorCode::INSUFFICIENT_CHANGE_FOR_FEE,
                               "change output of " + change_before.to_string() +
                                   " BTC cannot cover a fee of " +
                                   plan.paid_fee.to_string() + " BTC");
        }

        TXCOMBINE_TRY_ASSIGN(adjusted,
            built.tx.with_output_amount(built.change_position, plan.change));
        TXCOMBINE_TRY_ASSIGN(signed_tx, sign_complete(node, adjusted));

        const size_t signed_size = signed_tx.total_size();
        if (primitives::FeeRate(plan.paid_fee, signed_size) >=
            fees.min_fee_rate) {
            return BuiltReplacement{std::move(signed_tx), plan.paid_fee,
                                    built.change_position};
        }
        LOG_DEBUG(logger, core::LogCategory::FEES,
                  "signed size grew from " + std::to_string(size) + " to " +
                      std::to_string(signed_size) + " bytes, replanning");
        size = signed_size;
    }

    return core::Error(core::ErrorCode::INTERNAL_ERROR,
                       "signed size keeps changing; feerate below " +
                           fees.min_fee_rate.to_string());
}

} // namespace merge
