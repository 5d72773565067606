// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "merge/builder.h"

#include "primitives/txin.h"

#include <string>
#include <utility>
#include <vector>

namespace merge {

namespace {

/// The first input of @p tx with signature data removed.
primitives::TxInput unsigned_first_input(const primitives::Transaction& tx) {
    primitives::TxInput in = tx.vin().front();
    in.script_sig.clear();
    in.witness.clear();
    return in;
}

} // namespace

primitives::Transaction make_skeleton(const CandidatePair& candidates,
                                      const node::DescendantMap& descendants,
                                      std::vector<primitives::TxOutput> payees,
                                      core::Logger& logger) {
    std::vector<primitives::TxInput> vin{
        unsigned_first_input(candidates.first.tx),
        unsigned_first_input(candidates.second.tx)};

    if (descendants.count(vin[1].prevout.txid) != 0) {
        LOG_DEBUG(logger, core::LogCategory::BUILD,
                  "dropping input " + vin[1].prevout.to_string() +
                      ": it spends a descendant");
        vin.erase(vin.begin() + 1);
    } else if (descendants.count(vin[0].prevout.txid) != 0) {
        LOG_DEBUG(logger, core::LogCategory::BUILD,
                  "dropping input " + vin[0].prevout.to_string() +
                      ": it spends a descendant");
        vin.erase(vin.begin());
    }

    return candidates.first.tx.with_inputs(std::move(vin))
        .with_outputs(std::move(payees));
}

core::Result<primitives::Transaction> sign_complete(
    node::NodeService& node, const primitives::Transaction& tx) {
    TXCOMBINE_TRY_ASSIGN(signed_tx, node.sign_transaction(tx));
    if (!signed_tx.complete) {
        return core::Error(core::ErrorCode::SIGNING_INCOMPLETE,
                           "wallet could not sign every input of the "
                           "replacement");
    }
    return std::move(signed_tx.tx);
}

core::Result<BuiltReplacement> build_replacement(
    node::NodeService& node, const CandidatePair& candidates,
    const Consolidation& consolidation, const FeeSummary& fees,
    bool opt_in, core::Logger& logger) {
    primitives::Transaction skeleton = make_skeleton(
        candidates, fees.descendants, payee_outputs(consolidation), logger);

    const Script* anchor = consolidation.change.anchor();
    TXCOMBINE_TRY_ASSIGN(funded,
        node.fund_transaction(skeleton, anchor ? *anchor : Script{}));

    if (funded.change_position < 0) {
        return core::Error(core::ErrorCode::UNSUPPORTED_NO_CHANGE,
                           "funding added no change output; a replacement "
                           "without change is not supported");
    }
    const auto change_position = static_cast<size_t>(funded.change_position);
    if (change_position >= funded.tx.vout().size()) {
        return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                           "funding reported change position " +
                               std::to_string(change_position) + " of " +
                               std::to_string(funded.tx.vout().size()) +
                               " outputs");
    }

    LOG_DEBUG(logger, core::LogCategory::BUILD,
              "funded: " + std::to_string(funded.tx.vin().size()) +
                  " inputs, fee " + funded.fee.to_string() +
                  " BTC, change at " + std::to_string(change_position));

    const uint32_t sequence = opt_in ? SEQUENCE_OPT_IN
                                     : primitives::TxInput::SEQUENCE_NO_RBF;
    TXCOMBINE_TRY_ASSIGN(signed_tx,
        sign_complete(node, funded.tx.with_sequences(sequence)));

    return BuiltReplacement{std::move(signed_tx), funded.fee, change_position};
}

} // namespace merge
