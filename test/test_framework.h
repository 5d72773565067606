#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Minimal unit test framework for txcombine.

#include "core/error.h"

#include <cmath>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace test {

// ---------------------------------------------------------------------------
// Test registry
// ---------------------------------------------------------------------------

struct TestCase {
    std::string suite;
    std::string name;
    std::function<void()> func;
};

inline std::vector<TestCase>& test_registry() {
    static std::vector<TestCase> registry;
    return registry;
}

inline int& fail_count() {
    static int count = 0;
    return count;
}

inline int& pass_count() {
    static int count = 0;
    return count;
}

struct TestRegistrar {
    TestRegistrar(const char* suite, const char* name, std::function<void()> fn) {
        test_registry().push_back({suite, name, std::move(fn)});
    }
};

// ---------------------------------------------------------------------------
// Assertion helpers
// ---------------------------------------------------------------------------

inline void record(bool passed) {
    ++(passed ? pass_count() : fail_count());
}

/// Prints "  FAIL: file:line: <what>" and counts the failure.
inline void fail_at(const char* file, int line, const std::string& what) {
    std::cerr << "  FAIL: " << file << ":" << line << ": " << what
              << std::endl;
    record(false);
}

inline void check_impl(bool cond, const char* expr, const char* file, int line) {
    if (!cond) {
        fail_at(file, line, std::string("CHECK(") + expr + ")");
        return;
    }
    record(true);
}

template <typename A, typename B>
void check_eq_impl(const A& a, const B& b,
                   const char* a_expr, const char* b_expr,
                   const char* file, int line) {
    if (!(a == b)) {
        fail_at(file, line,
                std::string("CHECK_EQ(") + a_expr + ", " + b_expr + ")");
        return;
    }
    record(true);
}

template <typename A, typename B>
void check_ne_impl(const A& a, const B& b,
                   const char* a_expr, const char* b_expr,
                   const char* file, int line) {
    if (a == b) {
        fail_at(file, line,
                std::string("CHECK_NE(") + a_expr + ", " + b_expr + ")");
        return;
    }
    record(true);
}

/// The result must be an error carrying @p expected.
template <typename R>
void check_err_code_impl(const R& result, core::ErrorCode expected,
                         const char* expr, const char* file, int line) {
    const std::string label = std::string("CHECK_ERR_CODE(") + expr + ")";
    if (result.ok()) {
        fail_at(file, line, label + " was ok");
        return;
    }
    const core::Error& err = result.error();
    if (err.code() != expected) {
        fail_at(file, line,
                label + " got " + std::string(core::error_code_name(err.code())) +
                    " (" + err.message() + "), expected " +
                    std::string(core::error_code_name(expected)));
        return;
    }
    record(true);
}

inline bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

// ---------------------------------------------------------------------------
// Macros
// ---------------------------------------------------------------------------

#define TEST_CASE(suite, name)                                       \
    static void test_##suite##_##name();                             \
    static ::test::TestRegistrar reg_##suite##_##name(               \
        #suite, #name, test_##suite##_##name);                       \
    static void test_##suite##_##name()

#define CHECK(expr) ::test::check_impl((expr), #expr, __FILE__, __LINE__)
#define CHECK_EQ(a, b) ::test::check_eq_impl((a), (b), #a, #b, __FILE__, __LINE__)
#define CHECK_NE(a, b) ::test::check_ne_impl((a), (b), #a, #b, __FILE__, __LINE__)

// Result<T> checks. CHECK_OK prints the error message on failure.
#define CHECK_OK(result_expr) do {                                    \
    auto&& _r = (result_expr);                                       \
    if (_r.ok()) {                                                   \
        ::test::record(true);                                        \
    } else {                                                         \
        ::test::fail_at(__FILE__, __LINE__,                          \
                        "CHECK_OK(" #result_expr ") failed: " +      \
                            _r.error().message());                   \
    }                                                                \
} while (0)

#define CHECK_ERR(result_expr) do {                                   \
    auto&& _r = (result_expr);                                       \
    if (_r.ok()) {                                                   \
        ::test::fail_at(__FILE__, __LINE__,                          \
                        "CHECK_ERR(" #result_expr ") was ok");       \
    } else {                                                         \
        ::test::record(true);                                        \
    }                                                                \
} while (0)

// Check that a Result<T> is an error with the given core::ErrorCode
#define CHECK_ERR_CODE(result_expr, code)                             \
    ::test::check_err_code_impl((result_expr), (code), #result_expr,  \
                                __FILE__, __LINE__)

// ---------------------------------------------------------------------------
// Runner
// ---------------------------------------------------------------------------

/// Runs every registered test whose suite starts with @p filter (all of
/// them when it is empty). Returns the process exit code.
inline int run_all_tests(std::string_view filter = {}) {
    fail_count() = 0;
    pass_count() = 0;

    std::string last_suite;
    int tests_run = 0;

    for (auto& tc : test_registry()) {
        if (!filter.empty() && tc.suite.rfind(filter, 0) != 0) continue;

        if (tc.suite != last_suite) {
            std::cout << "\n=== " << tc.suite << " ===" << std::endl;
            last_suite = tc.suite;
        }

        std::cout << "  " << tc.name << "... " << std::flush;

        int fails_before = fail_count();
        try {
            tc.func();
        } catch (const std::exception& e) {
            std::cerr << "\n  EXCEPTION: " << e.what() << std::endl;
            ++fail_count();
        }

        if (fail_count() == fails_before) {
            std::cout << "ok" << std::endl;
        } else {
            std::cout << "FAILED" << std::endl;
        }
        ++tests_run;
    }

    std::cout << "\n========================================" << std::endl;
    std::cout << "Tests run: " << tests_run << std::endl;
    std::cout << "Checks passed: " << pass_count() << std::endl;
    std::cout << "Checks failed: " << fail_count() << std::endl;
    std::cout << "========================================" << std::endl;

    return fail_count() > 0 ? 1 : 0;
}

} // namespace test
