#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_RPC_HTTP_CLIENT_H
#define TXCOMBINE_RPC_HTTP_CLIENT_H

#include "core/error.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace rpc {

struct HttpResponse {
    int         status = 0;
    std::string body;
};

// ---------------------------------------------------------------------------
// HttpTransport -- POSTs one request body to a path on the node
// ---------------------------------------------------------------------------
// The JSON-RPC client depends only on this interface; tests substitute a
// scripted transport.
// ---------------------------------------------------------------------------
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// Sends @p body to @p path and returns the status and body. Transport
    /// failures (resolve, connect, send, receive, timeout) are errors; any
    /// HTTP status, including 4xx/5xx, is a successful response.
    virtual core::Result<HttpResponse> post(const std::string& path,
                                            const std::string& body) = 0;
};

struct HttpClientOptions {
    std::string host = "127.0.0.1";
    uint16_t    port = 8332;
    /// Full Authorization header value, e.g. "Basic dXNlcjpwYXNz".
    std::string authorization;
    /// Socket send/receive timeout; 0 disables it.
    int         timeout_seconds = 900;
};

// ---------------------------------------------------------------------------
// HttpClient -- minimal blocking HTTP/1.1 client over POSIX sockets
// ---------------------------------------------------------------------------
// One connection per request with "Connection: close"; the reply is read
// until the peer closes or Content-Length bytes have arrived. Chunked
// replies are decoded.
// ---------------------------------------------------------------------------
class HttpClient final : public HttpTransport {
public:
    explicit HttpClient(HttpClientOptions options)
        : options_(std::move(options)) {}

    core::Result<HttpResponse> post(const std::string& path,
                                    const std::string& body) override;

private:
    HttpClientOptions options_;
};

/// Split a raw HTTP/1.x response into status and decoded body.
/// Exposed for tests.
[[nodiscard]] core::Result<HttpResponse> parse_http_response(
    std::string_view raw);

} // namespace rpc

#endif // TXCOMBINE_RPC_HTTP_CLIENT_H
