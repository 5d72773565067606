// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:              return "NONE";

        // Parsing
        case ErrorCode::PARSE_ERROR:       return "PARSE_ERROR";
        case ErrorCode::PARSE_OVERFLOW:    return "PARSE_OVERFLOW";
        case ErrorCode::PARSE_UNDERFLOW:   return "PARSE_UNDERFLOW";
        case ErrorCode::PARSE_BAD_FORMAT:  return "PARSE_BAD_FORMAT";

        // Configuration
        case ErrorCode::CONFIG_ERROR:      return "CONFIG_ERROR";
        case ErrorCode::CONFIG_MISSING:    return "CONFIG_MISSING";

        // Network
        case ErrorCode::NETWORK_ERROR:     return "NETWORK_ERROR";
        case ErrorCode::NETWORK_TIMEOUT:   return "NETWORK_TIMEOUT";
        case ErrorCode::NETWORK_REFUSED:   return "NETWORK_REFUSED";
        case ErrorCode::NETWORK_CLOSED:    return "NETWORK_CLOSED";

        // Cryptography
        case ErrorCode::CRYPTO_ERROR:      return "CRYPTO_ERROR";
        case ErrorCode::CRYPTO_HASH_FAIL:  return "CRYPTO_HASH_FAIL";

        // Candidate validation
        case ErrorCode::INVALID_IDENTIFIER:
            return "INVALID_IDENTIFIER";
        case ErrorCode::NOT_IN_WALLET:     return "NOT_IN_WALLET";
        case ErrorCode::ALREADY_CONFIRMED: return "ALREADY_CONFIRMED";
        case ErrorCode::NOT_REPLACEABLE:   return "NOT_REPLACEABLE";
        case ErrorCode::MEMPOOL_ENTRY_UNAVAILABLE:
            return "MEMPOOL_ENTRY_UNAVAILABLE";

        // Replacement construction
        case ErrorCode::FUNDING_FAILED:    return "FUNDING_FAILED";
        case ErrorCode::UNSUPPORTED_NO_CHANGE:
            return "UNSUPPORTED_NO_CHANGE";
        case ErrorCode::SIGNING_INCOMPLETE:
            return "SIGNING_INCOMPLETE";
        case ErrorCode::INSUFFICIENT_CHANGE_FOR_FEE:
            return "INSUFFICIENT_CHANGE_FOR_FEE";
        case ErrorCode::CONFLICT_INVARIANT_VIOLATED:
            return "CONFLICT_INVARIANT_VIOLATED";

        // RPC
        case ErrorCode::RPC_ERROR:         return "RPC_ERROR";
        case ErrorCode::RPC_INVALID_REPLY: return "RPC_INVALID_REPLY";
        case ErrorCode::RPC_UNAUTHORIZED:  return "RPC_UNAUTHORIZED";
        case ErrorCode::RPC_HTTP_ERROR:    return "RPC_HTTP_ERROR";

        // Internal
        case ErrorCode::INTERNAL_ERROR:    return "INTERNAL_ERROR";
    }

    return "UNKNOWN";
}

bool is_internal_fault(ErrorCode code) noexcept {
    return code == ErrorCode::CONFLICT_INVARIANT_VIOLATED ||
           code == ErrorCode::INTERNAL_ERROR;
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    // Append source location when available (file name is non-empty).
    const char* file = where_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << where_.line()
            << ':' << where_.column() << ']';
    }

    return oss.str();
}

} // namespace core
