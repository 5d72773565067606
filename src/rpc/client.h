#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_RPC_CLIENT_H
#define TXCOMBINE_RPC_CLIENT_H

#include "core/error.h"
#include "core/logging.h"
#include "rpc/http_client.h"
#include "rpc/json.h"

#include <cstdint>
#include <optional>
#include <string>

namespace rpc {

// ---------------------------------------------------------------------------
// RpcErrorCode -- node-side JSON-RPC error codes this client interprets
// ---------------------------------------------------------------------------
enum class RpcErrorCode : int {
    METHOD_NOT_FOUND          = -32601,
    MISC_ERROR                = -1,
    TYPE_ERROR                = -3,
    WALLET_ERROR              = -4,
    INVALID_ADDRESS_OR_KEY    = -5,
    WALLET_INSUFFICIENT_FUNDS = -6,
    INVALID_PARAMETER         = -8,
    DESERIALIZATION_ERROR     = -22,
    VERIFY_ERROR              = -25,
    VERIFY_REJECTED           = -26,
    VERIFY_ALREADY_IN_CHAIN   = -27,
    IN_WARMUP                 = -28,
    WALLET_NOT_FOUND          = -18,
    WALLET_NOT_SPECIFIED      = -19,
};

/// Error object carried by a JSON-RPC reply.
struct RpcNodeError {
    int         code = 0;
    std::string message;

    [[nodiscard]] bool is(RpcErrorCode c) const {
        return code == static_cast<int>(c);
    }
};

/// A decoded JSON-RPC reply: either a result or a node error.
struct RpcReply {
    JsonValue                   result;
    std::optional<RpcNodeError> error;
};

// ---------------------------------------------------------------------------
// RpcClient -- JSON-RPC 1.0 client for a Bitcoin Core compatible node
// ---------------------------------------------------------------------------
// Node-wide calls go to "/"; wallet calls go to "/wallet/<name>" when a
// wallet name is configured. Requests are numbered sequentially.
// ---------------------------------------------------------------------------
class RpcClient {
public:
    RpcClient(HttpTransport& transport, core::Logger& logger,
              std::string wallet_name = {});

    /// Sends one request and decodes the reply. Transport, HTTP and
    /// decoding problems are errors; a node-side error is returned inside
    /// the reply so callers can branch on its code.
    core::Result<RpcReply> request(const std::string& method,
                                   const JsonValue& params,
                                   bool wallet_call = false);

    /// request() with a node-side error folded into RPC_ERROR.
    core::Result<JsonValue> call(const std::string& method,
                                 const JsonValue& params,
                                 bool wallet_call = false);

private:
    HttpTransport& transport_;
    core::Logger&  logger_;
    std::string    wallet_path_;
    int64_t        next_id_ = 1;
};

} // namespace rpc

#endif // TXCOMBINE_RPC_CLIENT_H
