#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_CORE_ERROR_H
#define TXCOMBINE_CORE_ERROR_H

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------
// Grouped by hundreds. 500-699 are the outcomes a user sees when a merge is
// refused; everything else comes from parsing, configuration, the transport
// or the node.
// ---------------------------------------------------------------------------
enum class ErrorCode : uint16_t {
    NONE              = 0,
    // Parsing / serialization (100-199)
    PARSE_ERROR       = 100, PARSE_OVERFLOW  = 101,
    PARSE_UNDERFLOW   = 102, PARSE_BAD_FORMAT = 103,
    // Configuration (200-299)
    CONFIG_ERROR      = 200, CONFIG_MISSING  = 201,
    // Network (300-399)
    NETWORK_ERROR     = 300, NETWORK_TIMEOUT = 301,
    NETWORK_REFUSED   = 302, NETWORK_CLOSED  = 303,
    // Cryptography (400-499)
    CRYPTO_ERROR      = 400, CRYPTO_HASH_FAIL = 401,
    // Candidate validation (500-599)
    INVALID_IDENTIFIER        = 500,
    NOT_IN_WALLET             = 501,
    ALREADY_CONFIRMED         = 502,
    NOT_REPLACEABLE           = 503,
    MEMPOOL_ENTRY_UNAVAILABLE = 504,
    // Replacement construction (600-699)
    FUNDING_FAILED              = 600,
    UNSUPPORTED_NO_CHANGE       = 601,
    SIGNING_INCOMPLETE          = 602,
    INSUFFICIENT_CHANGE_FOR_FEE = 603,
    CONFLICT_INVARIANT_VIOLATED = 604,
    // RPC (700-799)
    RPC_ERROR         = 700, RPC_INVALID_REPLY = 701,
    RPC_UNAUTHORIZED  = 702, RPC_HTTP_ERROR    = 703,
    // Internal (900-999)
    INTERNAL_ERROR    = 900,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

/// True for codes that signal a broken internal invariant rather than bad
/// user input or an unhelpful node.
[[nodiscard]] bool is_internal_fault(ErrorCode code) noexcept;

// ---------------------------------------------------------------------------
// Error: code, message and the place it was raised
// ---------------------------------------------------------------------------
class Error {
public:
    Error() noexcept = default;

    explicit Error(
        ErrorCode code,
        std::string message = {},
        std::source_location where = std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), where_(where) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept {
        return message_;
    }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return where_;
    }
    [[nodiscard]] bool is_ok() const noexcept {
        return code_ == ErrorCode::NONE;
    }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_ok(); }

    /// "NAME(code): message [file:line:col]", for debug logs.
    [[nodiscard]] std::string format() const;

    /// Errors compare by code only.
    bool operator==(const Error& other) const noexcept {
        return code_ == other.code_;
    }

private:
    ErrorCode            code_ = ErrorCode::NONE;
    std::string          message_;
    std::source_location where_;
};

namespace detail {

[[noreturn]] inline void bad_result_access(const char* what) {
    throw std::logic_error(what);
}

} // namespace detail

// ---------------------------------------------------------------------------
// Result<T>: either a T or an Error
// ---------------------------------------------------------------------------
// Accessing the wrong alternative throws std::logic_error; callers test
// ok() first or go through TXCOMBINE_TRY_ASSIGN.
// ---------------------------------------------------------------------------
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result value and error types must differ");

public:
    Result(const T& val) : data_(val) {}             // NOLINT implicit
    Result(T&& val) : data_(std::move(val)) {}       // NOLINT implicit
    Result(const E& err) : data_(err) {}             // NOLINT implicit
    Result(E&& err) : data_(std::move(err)) {}       // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool has_value() const noexcept { return ok(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        expect_value();
        return std::get<0>(data_);
    }
    [[nodiscard]] const T& value() const& {
        expect_value();
        return std::get<0>(data_);
    }
    [[nodiscard]] T&& value() && {
        expect_value();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& error() & {
        expect_error();
        return std::get<1>(data_);
    }
    [[nodiscard]] const E& error() const& {
        expect_error();
        return std::get<1>(data_);
    }
    [[nodiscard]] E&& error() && {
        expect_error();
        return std::get<1>(std::move(data_));
    }

private:
    void expect_value() const {
        if (!ok()) detail::bad_result_access("Result holds an error");
    }
    void expect_error() const {
        if (ok()) detail::bad_result_access("Result holds a value");
    }

    std::variant<T, E> data_;
};

/// Result of an operation run only for its side effects.
template <typename E>
class Result<void, E> {
public:
    Result() noexcept = default;
    Result(const E& err) : error_(err), failed_(true) {}            // NOLINT implicit
    Result(E&& err) : error_(std::move(err)), failed_(true) {}      // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept { return !failed_; }
    [[nodiscard]] bool has_value() const noexcept { return ok(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void value() const {
        if (failed_) detail::bad_result_access("Result holds an error");
    }
    [[nodiscard]] E& error() & {
        expect_error();
        return error_;
    }
    [[nodiscard]] const E& error() const& {
        expect_error();
        return error_;
    }
    [[nodiscard]] E&& error() && {
        expect_error();
        return std::move(error_);
    }

private:
    void expect_error() const {
        if (!failed_) detail::bad_result_access("Result holds a value");
    }

    E    error_{};
    bool failed_ = false;
};

[[nodiscard]] inline Error make_error(
    ErrorCode code,
    std::string message = {},
    std::source_location where = std::source_location::current()) noexcept {
    return Error(code, std::move(message), where);
}

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

} // namespace core

// ---------------------------------------------------------------------------
// Propagation
// ---------------------------------------------------------------------------
//   TXCOMBINE_TRY_ASSIGN(tx, parse_transaction(hex));
//   TXCOMBINE_TRY_VOID(check_something());
//
// Both return the error from the enclosing function. The enclosing return
// type must be constructible from core::Error.
// ---------------------------------------------------------------------------

#define TXCOMBINE_TRY_ASSIGN(var, expr)                                   \
    auto _txc_tmp_##var = (expr);                                         \
    if (!_txc_tmp_##var.ok())                                             \
        return std::move(_txc_tmp_##var).error();                         \
    auto var = std::move(_txc_tmp_##var).value()

#define TXCOMBINE_TRY_VOID(expr)                                          \
    do {                                                                  \
        auto _txc_tmp = (expr);                                           \
        if (!_txc_tmp.ok()) return std::move(_txc_tmp).error();           \
    } while (false)

#endif // TXCOMBINE_CORE_ERROR_H
