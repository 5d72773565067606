// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "node/rpc_node_service.h"

#include "core/hex.h"
#include "rpc/util.h"

#include <string>
#include <utility>

namespace node {

namespace {

rpc::JsonValue params_of(rpc::JsonValue::Array items) {
    return rpc::JsonValue(std::move(items));
}

/// Decode the "hex" field of a reply into a Transaction.
core::Result<primitives::Transaction> tx_from_reply(
    const rpc::JsonValue& reply, const std::string& field) {
    auto hex = rpc::reply_string(reply, field);
    if (!hex.ok()) return hex.error();
    auto tx = primitives::Transaction::from_hex(hex.value());
    if (!tx.ok()) {
        return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                           "undecodable transaction in reply: " +
                               tx.error().message());
    }
    return std::move(tx).value();
}

/// A mempool lookup that the node answers with "not in mempool".
bool is_missing_from_mempool(const rpc::RpcNodeError& err) {
    return err.is(rpc::RpcErrorCode::INVALID_ADDRESS_OR_KEY);
}

} // namespace

// ---------------------------------------------------------------------------
// mempool_entry_from_json
// ---------------------------------------------------------------------------
core::Result<MempoolEntry> mempool_entry_from_json(
    const rpc::JsonValue& entry) {
    if (!entry.is_object()) {
        return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                           "mempool entry is not an object");
    }

    const rpc::JsonValue& fees = entry["fees"];
    const rpc::JsonValue* modified = nullptr;
    if (fees.is_object() && fees.has_key("modified")) {
        modified = &fees["modified"];
    } else if (entry.has_key("modifiedfee")) {
        modified = &entry["modifiedfee"];
    }
    if (modified == nullptr) {
        return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                           "mempool entry carries no modified fee");
    }

    TXCOMBINE_TRY_ASSIGN(fee, rpc::amount_from_value(*modified));
    MempoolEntry result;
    result.modified_fee = fee;
    return result;
}

// ---------------------------------------------------------------------------
// Wallet lookups
// ---------------------------------------------------------------------------
core::Result<void> RpcNodeService::get_wallet_transaction(
    const core::uint256& txid) {
    TXCOMBINE_TRY_ASSIGN(reply,
        client_.request("gettransaction", params_of({txid.to_hex()}), true));
    if (reply.error.has_value()) {
        if (reply.error->is(rpc::RpcErrorCode::INVALID_ADDRESS_OR_KEY)) {
            return core::Error(core::ErrorCode::NOT_IN_WALLET,
                               "transaction " + txid.to_hex() +
                                   " not found in wallet");
        }
        return core::Error(core::ErrorCode::RPC_ERROR,
                           "gettransaction: " + reply.error->message);
    }
    LOG_TRACE(logger_, core::LogCategory::WALLET,
              "wallet knows " + txid.to_hex());
    return core::make_ok();
}

core::Result<RawTransactionInfo> RpcNodeService::get_raw_transaction(
    const core::uint256& txid) {
    TXCOMBINE_TRY_ASSIGN(reply,
        client_.call("getrawtransaction", params_of({txid.to_hex(), true})));
    TXCOMBINE_TRY_ASSIGN(tx, tx_from_reply(reply, "hex"));

    RawTransactionInfo info;
    info.tx = std::move(tx);
    // Unconfirmed transactions carry no "confirmations" field at all.
    if (reply.has_key("confirmations")) {
        TXCOMBINE_TRY_ASSIGN(confs, rpc::reply_int(reply, "confirmations"));
        info.confirmations = confs;
    }
    return info;
}

core::Result<std::string> RpcNodeService::script_address(
    const std::vector<uint8_t>& script_pubkey) {
    TXCOMBINE_TRY_ASSIGN(decoded,
        client_.call("decodescript", params_of({core::to_hex(script_pubkey)})));

    // Nodes before 22.0 report a one-element "addresses" array instead.
    const rpc::JsonValue& single = std::as_const(decoded)["address"];
    const rpc::JsonValue& list = std::as_const(decoded)["addresses"];
    if (single.is_string()) {
        return single.get_string();
    }
    if (list.is_array() && list.size() > 0 &&
        list.get_array().front().is_string()) {
        return list.get_array().front().get_string();
    }
    return std::string{};
}

core::Result<bool> RpcNodeService::is_mine(
    const std::vector<uint8_t>& script_pubkey) {
    TXCOMBINE_TRY_ASSIGN(address, script_address(script_pubkey));
    if (address.empty()) {
        LOG_TRACE(logger_, core::LogCategory::WALLET,
                  "script " + core::to_hex(script_pubkey) + " has no address");
        return false;
    }

    TXCOMBINE_TRY_ASSIGN(info,
        client_.call("getaddressinfo", params_of({address}), true));
    return rpc::reply_bool(info, "ismine");
}

// ---------------------------------------------------------------------------
// Mempool
// ---------------------------------------------------------------------------
core::Result<MempoolEntry> RpcNodeService::get_mempool_entry(
    const core::uint256& txid) {
    TXCOMBINE_TRY_ASSIGN(reply,
        client_.request("getmempoolentry", params_of({txid.to_hex()})));
    if (reply.error.has_value()) {
        if (is_missing_from_mempool(*reply.error)) {
            return core::Error(core::ErrorCode::MEMPOOL_ENTRY_UNAVAILABLE,
                               "transaction " + txid.to_hex() +
                                   " is not in the mempool");
        }
        return core::Error(core::ErrorCode::RPC_ERROR,
                           "getmempoolentry: " + reply.error->message);
    }
    return mempool_entry_from_json(reply.result);
}

core::Result<DescendantMap> RpcNodeService::get_descendants(
    const core::uint256& txid) {
    TXCOMBINE_TRY_ASSIGN(reply,
        client_.request("getmempooldescendants",
                        params_of({txid.to_hex(), true})));
    if (reply.error.has_value()) {
        if (is_missing_from_mempool(*reply.error)) {
            return core::Error(core::ErrorCode::MEMPOOL_ENTRY_UNAVAILABLE,
                               "transaction " + txid.to_hex() +
                                   " is not in the mempool");
        }
        return core::Error(core::ErrorCode::RPC_ERROR,
                           "getmempooldescendants: " + reply.error->message);
    }
    if (!reply.result.is_object()) {
        return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                           "descendant set is not an object");
    }

    DescendantMap descendants;
    for (const auto& [id_hex, entry_json] : reply.result.get_object()) {
        auto id = core::uint256::from_hex(id_hex);
        if (!id.ok()) {
            return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                               "bad descendant txid '" + id_hex + "'");
        }
        TXCOMBINE_TRY_ASSIGN(entry, mempool_entry_from_json(entry_json));
        descendants[id.value()] = entry;
    }
    LOG_TRACE(logger_, core::LogCategory::MEMPOOL,
              txid.to_hex() + " has " + std::to_string(descendants.size()) +
                  " descendants");
    return descendants;
}

// ---------------------------------------------------------------------------
// Wallet transaction construction
// ---------------------------------------------------------------------------
core::Result<FundedTransaction> RpcNodeService::fund_transaction(
    const primitives::Transaction& tx,
    const std::vector<uint8_t>& change_script) {
    rpc::JsonValue options{rpc::JsonValue::Object{}};
    if (!change_script.empty()) {
        TXCOMBINE_TRY_ASSIGN(change_address, script_address(change_script));
        if (!change_address.empty()) {
            options["changeAddress"] = change_address;
        }
    }

    TXCOMBINE_TRY_ASSIGN(reply,
        client_.request("fundrawtransaction",
                        params_of({tx.to_hex(), options}), true));
    if (reply.error.has_value()) {
        return core::Error(core::ErrorCode::FUNDING_FAILED,
                           "fundrawtransaction: " + reply.error->message);
    }

    FundedTransaction funded;
    TXCOMBINE_TRY_ASSIGN(funded_tx, tx_from_reply(reply.result, "hex"));
    TXCOMBINE_TRY_ASSIGN(fee,
        rpc::amount_from_value(std::as_const(reply.result)["fee"]));
    TXCOMBINE_TRY_ASSIGN(changepos, rpc::reply_int(reply.result, "changepos"));
    funded.tx = std::move(funded_tx);
    funded.fee = fee;
    funded.change_position = changepos;
    return funded;
}

core::Result<SignedTransaction> RpcNodeService::sign_transaction(
    const primitives::Transaction& tx) {
    TXCOMBINE_TRY_ASSIGN(reply,
        client_.call("signrawtransactionwithwallet",
                     params_of({tx.to_hex()}), true));

    SignedTransaction signed_tx;
    TXCOMBINE_TRY_ASSIGN(decoded, tx_from_reply(reply, "hex"));
    TXCOMBINE_TRY_ASSIGN(complete, rpc::reply_bool(reply, "complete"));
    signed_tx.tx = std::move(decoded);
    signed_tx.complete = complete;
    return signed_tx;
}

core::Result<core::uint256> RpcNodeService::send_transaction(
    const primitives::Transaction& tx) {
    TXCOMBINE_TRY_ASSIGN(reply,
        client_.call("sendrawtransaction", params_of({tx.to_hex()})));
    if (!reply.is_string()) {
        return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                           "sendrawtransaction did not return a txid");
    }
    auto txid = core::uint256::from_hex(reply.get_string());
    if (!txid.ok()) {
        return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                           "sendrawtransaction returned a malformed txid");
    }
    return txid.value();
}

// ---------------------------------------------------------------------------
// Network
// ---------------------------------------------------------------------------
core::Result<NetworkInfo> RpcNodeService::get_network_info() {
    TXCOMBINE_TRY_ASSIGN(reply,
        client_.call("getnetworkinfo", rpc::JsonValue(rpc::JsonValue::Array{})));
    TXCOMBINE_TRY_ASSIGN(relay_per_kb,
        rpc::amount_from_value(std::as_const(reply)["relayfee"]));

    NetworkInfo info;
    info.relay_fee = primitives::FeeRate::from_per_kb(relay_per_kb);
    return info;
}

} // namespace node
