// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/client.h"

#include <cctype>
#include <utility>

namespace rpc {

namespace {

// Percent-encode a wallet name for use as a URI path segment.
std::string encode_path_segment(const std::string& name) {
    static constexpr char HEX[] = "0123456789ABCDEF";
    std::string out;
    for (char c : name) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else {
            out += '%';
            out += HEX[u >> 4];
            out += HEX[u & 0x0F];
        }
    }
    return out;
}

} // namespace

RpcClient::RpcClient(HttpTransport& transport, core::Logger& logger,
                     std::string wallet_name)
    : transport_(transport), logger_(logger) {
    if (!wallet_name.empty()) {
        wallet_path_ = "/wallet/" + encode_path_segment(wallet_name);
    }
}

core::Result<RpcReply> RpcClient::request(const std::string& method,
                                          const JsonValue& params,
                                          bool wallet_call) {
    JsonValue req;
    req["jsonrpc"] = "1.0";
    req["id"] = next_id_++;
    req["method"] = method;
    req["params"] = params.is_null() ? JsonValue(JsonValue::Array{}) : params;
    const std::string body = json_serialize(req);

    const std::string path =
        wallet_call && !wallet_path_.empty() ? wallet_path_ : "/";
    LOG_DEBUG(logger_, core::LogCategory::RPC,
              "-> " + path + " " + method + " " + json_serialize(params));

    TXCOMBINE_TRY_ASSIGN(http, transport_.post(path, body));

    if (http.status == 401) {
        return core::Error(core::ErrorCode::RPC_UNAUTHORIZED,
                           "incorrect rpcuser or rpcpassword "
                           "(authorization failed)");
    }
    if (http.body.empty()) {
        return core::Error(core::ErrorCode::RPC_HTTP_ERROR,
                           "HTTP status " + std::to_string(http.status) +
                           " with empty body");
    }

    // Bitcoin Core reports JSON-RPC errors with HTTP 404/500 and a JSON
    // body, so the body is decoded whatever the status.
    auto parsed = parse_json(http.body);
    if (!parsed.ok()) {
        return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                           "HTTP status " + std::to_string(http.status) +
                           ", unparsable body: " +
                           parsed.error().message());
    }
    const JsonValue& doc = parsed.value();
    if (!doc.is_object()) {
        return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                           "reply is not a JSON object");
    }

    RpcReply reply;
    const JsonValue& err = doc["error"];
    if (!err.is_null()) {
        RpcNodeError node_error;
        if (err["code"].is_int()) {
            node_error.code = static_cast<int>(err["code"].get_int());
        }
        if (err["message"].is_string()) {
            node_error.message = err["message"].get_string();
        }
        LOG_DEBUG(logger_, core::LogCategory::RPC,
                  "<- " + method + " error " +
                  std::to_string(node_error.code) + ": " +
                  node_error.message);
        reply.error = std::move(node_error);
        return reply;
    }

    if (!doc.has_key("result")) {
        return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                           "reply has neither result nor error");
    }
    reply.result = doc["result"];
    LOG_TRACE(logger_, core::LogCategory::RPC,
              "<- " + method + " " + json_serialize(reply.result));
    return reply;
}

core::Result<JsonValue> RpcClient::call(const std::string& method,
                                        const JsonValue& params,
                                        bool wallet_call) {
    TXCOMBINE_TRY_ASSIGN(reply, request(method, params, wallet_call));
    if (reply.error) {
        return core::Error(core::ErrorCode::RPC_ERROR,
                           method + ": " + reply.error->message +
                           " (code " + std::to_string(reply.error->code) +
                           ")");
    }
    return std::move(reply.result);
}

} // namespace rpc
