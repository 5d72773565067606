// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/util.h"

#include <algorithm>
#include <charconv>

namespace rpc {

using primitives::Amount;

// ===========================================================================
// Amount parsing
// ===========================================================================

core::Result<Amount> amount_from_value(const JsonValue& val) {
    double btc = 0.0;
    if (val.is_number()) {
        btc = val.get_double();
    } else if (val.is_string()) {
        const std::string& s = val.get_string();
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), btc);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                               "invalid amount string '" + s + "'");
        }
    } else {
        return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                           "amount is not a number");
    }
    return Amount::from_btc(btc);
}

// ===========================================================================
// Reply field extraction
// ===========================================================================

namespace {

core::Error bad_field(const std::string& key, const char* expected) {
    return core::Error(core::ErrorCode::RPC_INVALID_REPLY,
                       "reply field '" + key + "' missing or not " +
                       expected);
}

} // namespace

core::Result<std::string> reply_string(const JsonValue& obj,
                                       const std::string& key) {
    const JsonValue& v = obj[key];
    if (!v.is_string()) return bad_field(key, "a string");
    return v.get_string();
}

core::Result<int64_t> reply_int(const JsonValue& obj,
                                const std::string& key) {
    const JsonValue& v = obj[key];
    if (!v.is_int()) return bad_field(key, "an integer");
    return v.get_int();
}

core::Result<bool> reply_bool(const JsonValue& obj, const std::string& key) {
    const JsonValue& v = obj[key];
    if (!v.is_bool()) return bad_field(key, "a boolean");
    return v.get_bool();
}

// ===========================================================================
// Base64
// ===========================================================================

static constexpr char B64_TABLE[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(std::string_view input) {
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    for (size_t i = 0; i < input.size(); i += 3) {
        const size_t n = std::min<size_t>(3, input.size() - i);
        uint32_t triple = static_cast<uint32_t>(
                              static_cast<uint8_t>(input[i])) << 16;
        if (n > 1) triple |= static_cast<uint32_t>(
                                 static_cast<uint8_t>(input[i + 1])) << 8;
        if (n > 2) triple |= static_cast<uint8_t>(input[i + 2]);

        out += B64_TABLE[(triple >> 18) & 0x3F];
        out += B64_TABLE[(triple >> 12) & 0x3F];
        out += n > 1 ? B64_TABLE[(triple >> 6) & 0x3F] : '=';
        out += n > 2 ? B64_TABLE[triple & 0x3F] : '=';
    }
    return out;
}

std::string basic_auth_header(std::string_view user,
                              std::string_view password) {
    std::string creds;
    creds.reserve(user.size() + 1 + password.size());
    creds.append(user);
    creds.push_back(':');
    creds.append(password);
    return "Basic " + base64_encode(creds);
}

} // namespace rpc
