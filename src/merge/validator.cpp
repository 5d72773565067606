// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "merge/validator.h"

#include <string>
#include <utility>

namespace merge {

core::Result<core::uint256> parse_txid(std::string_view text,
                                       std::string_view label) {
    auto id = core::uint256::from_hex(text);
    if (!id.ok()) {
        return core::Error(core::ErrorCode::INVALID_IDENTIFIER,
                           std::string(label) + " is not a valid transaction id: '" +
                               std::string(text) + "'");
    }
    return id.value();
}

namespace {

core::Result<Candidate> fetch_candidate(node::NodeService& node,
                                        const core::uint256& txid,
                                        core::Logger& logger) {
    TXCOMBINE_TRY_ASSIGN(info, node.get_raw_transaction(txid));
    if (info.confirmations >= 1) {
        return core::Error(core::ErrorCode::ALREADY_CONFIRMED,
                           "transaction " + txid.to_hex() + " already has " +
                               std::to_string(info.confirmations) +
                               " confirmation(s)");
    }
    LOG_DEBUG(logger, core::LogCategory::WALLET,
              "candidate " + txid.to_hex() + ": " +
                  std::to_string(info.tx.vin().size()) + " inputs, " +
                  std::to_string(info.tx.vout().size()) + " outputs");
    return Candidate{txid, std::move(info.tx)};
}

core::Result<void> check_replaceable(const Candidate& candidate) {
    if (!candidate.tx.all_inputs_signal_rbf()) {
        return core::Error(core::ErrorCode::NOT_REPLACEABLE,
                           "transaction " + candidate.txid.to_hex() +
                               " does not signal replace-by-fee on every input");
    }
    return core::make_ok();
}

} // namespace

core::Result<CandidatePair> validate_candidates(node::NodeService& node,
                                                std::string_view txid1,
                                                std::string_view txid2,
                                                core::Logger& logger) {
    TXCOMBINE_TRY_ASSIGN(id1, parse_txid(txid1, "txid1"));
    TXCOMBINE_TRY_ASSIGN(id2, parse_txid(txid2, "txid2"));

    TXCOMBINE_TRY_VOID(node.get_wallet_transaction(id1));
    TXCOMBINE_TRY_VOID(node.get_wallet_transaction(id2));

    TXCOMBINE_TRY_ASSIGN(first, fetch_candidate(node, id1, logger));
    TXCOMBINE_TRY_ASSIGN(second, fetch_candidate(node, id2, logger));

    TXCOMBINE_TRY_VOID(check_replaceable(first));
    TXCOMBINE_TRY_VOID(check_replaceable(second));

    return CandidatePair{std::move(first), std::move(second)};
}

} // namespace merge
