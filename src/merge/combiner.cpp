// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "merge/combiner.h"

#include "merge/builder.h"
#include "merge/consolidator.h"
#include "merge/fee_adjuster.h"
#include "merge/publisher.h"
#include "merge/validator.h"
#include "primitives/fees.h"

#include <cstdio>
#include <string>
#include <utility>

namespace merge {

namespace {

std::string kilobytes(size_t size) {
    char buf[32];
    int n = std::snprintf(buf, sizeof(buf), "%.3f KB",
                          static_cast<double>(size) / 1000.0);
    return std::string(buf, static_cast<size_t>(n));
}

std::string fee_and_rate(primitives::Amount fee, size_t size) {
    return fee.to_string() + ", " +
           primitives::FeeRate(fee, size).to_string();
}

} // namespace

core::Result<CombineOutcome> Combiner::run(std::string_view txid1,
                                           std::string_view txid2) {
    TXCOMBINE_TRY_ASSIGN(candidates,
        validate_candidates(node_, txid1, txid2, logger_));

    TXCOMBINE_TRY_ASSIGN(consolidation,
        consolidate_outputs(node_, candidates.first.tx, candidates.second.tx,
                            logger_));

    TXCOMBINE_TRY_ASSIGN(fees, account_fees(node_, candidates, logger_));

    TXCOMBINE_TRY_ASSIGN(built,
        build_replacement(node_, candidates, consolidation, fees,
                          options_.opt_in, logger_));

    TXCOMBINE_TRY_ASSIGN(adjusted, adjust_fees(node_, built, fees, logger_));

    log_report(fees, adjusted.tx, adjusted.fee);

    TXCOMBINE_TRY_VOID(verify_conflicts(adjusted.tx, candidates.first.tx,
                                        candidates.second.tx));

    TXCOMBINE_TRY_ASSIGN(publication,
        publish(node_, adjusted.tx, options_.dry_run, logger_));

    CombineOutcome outcome;
    outcome.tx = std::move(adjusted.tx);
    outcome.fee = adjusted.fee;
    outcome.fees = std::move(fees);
    outcome.broadcast = publication.broadcast;
    outcome.output = std::move(publication.output);
    return outcome;
}

void Combiner::log_report(const FeeSummary& fees,
                          const primitives::Transaction& replacement,
                          primitives::Amount fee) {
    if (!logger_.will_log(core::LogLevel::DEBUG, core::LogCategory::FEES)) {
        return;
    }

    const size_t combined = fees.size1 + fees.size2;
    LOG_DEBUG(logger_, core::LogCategory::FEES,
              "old sizes: " + kilobytes(fees.size1) + " " +
                  kilobytes(fees.size2) + " (" + kilobytes(combined) +
                  " combined), old fees: " +
                  fee_and_rate(fees.fee1, fees.size1) + "; " +
                  fee_and_rate(fees.fee2, fees.size2) + " (" +
                  fee_and_rate(fees.old_fees, combined) + " combined)");

    const size_t size = replacement.total_size();
    LOG_DEBUG(logger_, core::LogCategory::FEES,
              "new tx size: " + kilobytes(size) + ", new fee: " +
                  fee_and_rate(fee, size));
}

} // namespace merge
