#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_MERGE_VALIDATOR_H
#define TXCOMBINE_MERGE_VALIDATOR_H

#include "core/error.h"
#include "core/logging.h"
#include "core/types.h"
#include "node/node_service.h"
#include "primitives/transaction.h"

#include <string_view>

namespace merge {

/// One of the two transactions to combine, as fetched from the node.
struct Candidate {
    core::uint256           txid;
    primitives::Transaction tx;
};

struct CandidatePair {
    Candidate first;
    Candidate second;
};

/// Parse a user-supplied transaction id (64 hex digits, display order).
/// INVALID_IDENTIFIER names @p label ("txid1" / "txid2") on failure.
[[nodiscard]] core::Result<core::uint256> parse_txid(std::string_view text,
                                                     std::string_view label);

// ---------------------------------------------------------------------------
// validate_candidates
// ---------------------------------------------------------------------------
// Checks, in order, stopping at the first failure:
//   1. both ids parse                      INVALID_IDENTIFIER
//   2. both are wallet transactions        NOT_IN_WALLET
//   3. neither is confirmed                ALREADY_CONFIRMED
//   4. every input of both signals BIP125  NOT_REPLACEABLE
// Both ids are parsed before the node is contacted. Nothing is modified.
// ---------------------------------------------------------------------------
[[nodiscard]] core::Result<CandidatePair> validate_candidates(
    node::NodeService& node, std::string_view txid1, std::string_view txid2,
    core::Logger& logger);

} // namespace merge

#endif // TXCOMBINE_MERGE_VALIDATOR_H
