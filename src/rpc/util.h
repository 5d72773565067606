#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_RPC_UTIL_H
#define TXCOMBINE_RPC_UTIL_H

#include "core/error.h"
#include "core/types.h"
#include "primitives/amount.h"
#include "rpc/json.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace rpc {

// ---------------------------------------------------------------------------
// Amount parsing
// ---------------------------------------------------------------------------

/// Parse a JSON value carrying a BTC amount (number or numeric string, as
/// in every node reply) into satoshis. Negative values are accepted:
/// prioritisetransaction can push a modified fee below zero.
[[nodiscard]] core::Result<primitives::Amount> amount_from_value(
    const JsonValue& val);

// ---------------------------------------------------------------------------
// Reply field extraction
// ---------------------------------------------------------------------------
// Each helper returns RPC_INVALID_REPLY naming the field when it is absent
// or of the wrong kind.
// ---------------------------------------------------------------------------

[[nodiscard]] core::Result<std::string> reply_string(
    const JsonValue& obj, const std::string& key);

[[nodiscard]] core::Result<int64_t> reply_int(
    const JsonValue& obj, const std::string& key);

[[nodiscard]] core::Result<bool> reply_bool(
    const JsonValue& obj, const std::string& key);

// ---------------------------------------------------------------------------
// HTTP Basic Auth helpers
// ---------------------------------------------------------------------------

/// Standard Base64 (RFC 4648) with padding.
[[nodiscard]] std::string base64_encode(std::string_view input);

/// "Basic <base64(user:password)>"
[[nodiscard]] std::string basic_auth_header(std::string_view user,
                                            std::string_view password);

} // namespace rpc

#endif // TXCOMBINE_RPC_UTIL_H
