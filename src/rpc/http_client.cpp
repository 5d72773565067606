// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/http_client.h"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <memory>
#include <optional>
#include <utility>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace rpc {

namespace {

// ---------------------------------------------------------------------------
// RAII socket / addrinfo holders
// ---------------------------------------------------------------------------
class Socket {
public:
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket() { if (fd_ >= 0) ::close(fd_); }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    [[nodiscard]] int fd() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

struct AddrInfoDeleter {
    void operator()(struct addrinfo* ai) const {
        if (ai) ::freeaddrinfo(ai);
    }
};

void set_timeout(int fd, int optname, int seconds) {
    struct timeval tv{};
    tv.tv_sec = seconds;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, optname, &tv, sizeof(tv));
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
        sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' ||
                           sv.back() == '\r'))
        sv.remove_suffix(1);
    return sv;
}

core::Result<std::string> decode_chunked(std::string_view data) {
    std::string out;
    for (;;) {
        auto eol = data.find("\r\n");
        if (eol == std::string_view::npos) {
            return core::Error(core::ErrorCode::RPC_HTTP_ERROR,
                               "truncated chunk header");
        }
        std::string_view size_field = data.substr(0, eol);
        if (auto semi = size_field.find(';');
            semi != std::string_view::npos) {
            size_field = size_field.substr(0, semi);
        }
        size_field = trim(size_field);
        size_t chunk = 0;
        auto [ptr, ec] = std::from_chars(
            size_field.data(), size_field.data() + size_field.size(),
            chunk, 16);
        if (ec != std::errc{} || ptr != size_field.data() + size_field.size()) {
            return core::Error(core::ErrorCode::RPC_HTTP_ERROR,
                               "bad chunk size");
        }
        data.remove_prefix(eol + 2);
        if (chunk == 0) return out;
        if (chunk > data.size() || data.size() - chunk < 2) {
            return core::Error(core::ErrorCode::RPC_HTTP_ERROR,
                               "truncated chunk");
        }
        out.append(data.substr(0, chunk));
        data.remove_prefix(chunk + 2);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// parse_http_response
// ---------------------------------------------------------------------------
core::Result<HttpResponse> parse_http_response(std::string_view raw) {
    auto header_end = raw.find("\r\n\r\n");
    if (header_end == std::string_view::npos) {
        return core::Error(core::ErrorCode::RPC_HTTP_ERROR,
                           raw.empty() ? "empty reply from server"
                                       : "malformed HTTP reply");
    }
    std::string_view head = raw.substr(0, header_end);
    std::string_view body = raw.substr(header_end + 4);

    // Status line: HTTP/1.1 200 OK
    auto line_end = head.find("\r\n");
    std::string_view status_line = head.substr(0, line_end);
    if (!status_line.starts_with("HTTP/")) {
        return core::Error(core::ErrorCode::RPC_HTTP_ERROR,
                           "malformed HTTP status line");
    }
    auto sp = status_line.find(' ');
    HttpResponse response;
    if (sp == std::string_view::npos ||
        std::from_chars(status_line.data() + sp + 1,
                        status_line.data() + status_line.size(),
                        response.status).ec != std::errc{}) {
        return core::Error(core::ErrorCode::RPC_HTTP_ERROR,
                           "malformed HTTP status line");
    }

    bool chunked = false;
    std::optional<size_t> content_length;
    std::string_view headers = line_end == std::string_view::npos
                                   ? std::string_view{}
                                   : head.substr(line_end + 2);
    while (!headers.empty()) {
        auto eol = headers.find("\r\n");
        std::string_view line = headers.substr(0, eol);
        headers = eol == std::string_view::npos ? std::string_view{}
                                                : headers.substr(eol + 2);
        auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        std::string_view name = trim(line.substr(0, colon));
        std::string_view value = trim(line.substr(colon + 1));
        if (iequals(name, "Content-Length")) {
            size_t len = 0;
            if (std::from_chars(value.data(), value.data() + value.size(),
                                len).ec == std::errc{}) {
                content_length = len;
            }
        } else if (iequals(name, "Transfer-Encoding") &&
                   iequals(value, "chunked")) {
            chunked = true;
        }
    }

    if (chunked) {
        TXCOMBINE_TRY_ASSIGN(decoded, decode_chunked(body));
        response.body = std::move(decoded);
    } else if (content_length) {
        if (body.size() < *content_length) {
            return core::Error(core::ErrorCode::NETWORK_CLOSED,
                               "connection closed after " +
                               std::to_string(body.size()) + " of " +
                               std::to_string(*content_length) +
                               " body bytes");
        }
        response.body = std::string(body.substr(0, *content_length));
    } else {
        response.body = std::string(body);
    }
    return response;
}

// ---------------------------------------------------------------------------
// HttpClient::post
// ---------------------------------------------------------------------------
core::Result<HttpResponse> HttpClient::post(const std::string& path,
                                            const std::string& body) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo* raw_result = nullptr;
    const std::string port_str = std::to_string(options_.port);
    int rc = ::getaddrinfo(options_.host.c_str(), port_str.c_str(),
                           &hints, &raw_result);
    if (rc != 0) {
        return core::Error(core::ErrorCode::NETWORK_ERROR,
                           "cannot resolve " + options_.host + ": " +
                           ::gai_strerror(rc));
    }
    std::unique_ptr<struct addrinfo, AddrInfoDeleter> result(raw_result);

    // Try each resolved address until one connects.
    std::unique_ptr<Socket> sock;
    int last_errno = 0;
    for (auto* ai = result.get(); ai != nullptr; ai = ai->ai_next) {
        auto candidate = std::make_unique<Socket>(
            ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!candidate->valid()) {
            last_errno = errno;
            continue;
        }
        if (options_.timeout_seconds > 0) {
            set_timeout(candidate->fd(), SO_RCVTIMEO, options_.timeout_seconds);
            set_timeout(candidate->fd(), SO_SNDTIMEO, options_.timeout_seconds);
        }
        if (::connect(candidate->fd(), ai->ai_addr, ai->ai_addrlen) == 0) {
            sock = std::move(candidate);
            break;
        }
        last_errno = errno;
    }
    if (!sock) {
        return core::Error(core::ErrorCode::NETWORK_REFUSED,
                           "cannot connect to " + options_.host + ":" +
                           port_str + ": " + std::strerror(last_errno));
    }

    std::string request =
        "POST " + path + " HTTP/1.1\r\n"
        "Host: " + options_.host + "\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "Connection: close\r\n";
    if (!options_.authorization.empty()) {
        request += "Authorization: " + options_.authorization + "\r\n";
    }
    request += "\r\n";
    request += body;

    size_t sent = 0;
    while (sent < request.size()) {
        ssize_t n = ::send(sock->fd(), request.data() + sent,
                           request.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            const bool timed_out = errno == EAGAIN || errno == EWOULDBLOCK;
            return core::Error(timed_out ? core::ErrorCode::NETWORK_TIMEOUT
                                         : core::ErrorCode::NETWORK_ERROR,
                               std::string("send failed: ") +
                               std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }

    std::string raw;
    char buf[4096];
    for (;;) {
        ssize_t n = ::recv(sock->fd(), buf, sizeof(buf), 0);
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            const bool timed_out = errno == EAGAIN || errno == EWOULDBLOCK;
            return core::Error(timed_out ? core::ErrorCode::NETWORK_TIMEOUT
                                         : core::ErrorCode::NETWORK_ERROR,
                               std::string("receive failed: ") +
                               std::strerror(errno));
        }
        raw.append(buf, static_cast<size_t>(n));
    }

    return parse_http_response(raw);
}

} // namespace rpc
