#pragma once
// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TXCOMBINE_RPC_JSON_H
#define TXCOMBINE_RPC_JSON_H

#include "core/error.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rpc {

// ---------------------------------------------------------------------------
// JsonValue -- JSON document node
// ---------------------------------------------------------------------------
// One of: null, bool, int64_t, double, string, array, object. Integral
// literals parse as int64_t; anything with a fraction or exponent parses as
// double. Typed accessors throw std::runtime_error on a kind mismatch; the
// RPC layer catches that at its boundary and reports RPC_INVALID_REPLY.
// ---------------------------------------------------------------------------

struct NullValue {
    bool operator==(const NullValue&) const { return true; }
};

class JsonValue {
public:
    using Array  = std::vector<JsonValue>;
    using Object = std::map<std::string, JsonValue>;

    JsonValue()                   : storage_(NullValue{}) {}
    JsonValue(std::nullptr_t)     : storage_(NullValue{}) {}            // NOLINT
    JsonValue(bool v)             : storage_(v) {}                      // NOLINT
    JsonValue(int v)              : storage_(static_cast<int64_t>(v)) {} // NOLINT
    JsonValue(int64_t v)          : storage_(v) {}                      // NOLINT
    JsonValue(uint32_t v)         : storage_(static_cast<int64_t>(v)) {} // NOLINT
    JsonValue(double v)           : storage_(v) {}                      // NOLINT
    JsonValue(const char* v)      : storage_(std::string(v)) {}         // NOLINT
    JsonValue(std::string v)      : storage_(std::move(v)) {}           // NOLINT
    JsonValue(std::string_view v) : storage_(std::string(v)) {}         // NOLINT
    JsonValue(Array v)            : storage_(std::move(v)) {}           // NOLINT
    JsonValue(Object v)           : storage_(std::move(v)) {}           // NOLINT

    [[nodiscard]] bool is_null()   const { return holds<NullValue>(); }
    [[nodiscard]] bool is_bool()   const { return holds<bool>(); }
    [[nodiscard]] bool is_int()    const { return holds<int64_t>(); }
    [[nodiscard]] bool is_double() const { return holds<double>(); }
    [[nodiscard]] bool is_number() const { return is_int() || is_double(); }
    [[nodiscard]] bool is_string() const { return holds<std::string>(); }
    [[nodiscard]] bool is_array()  const { return holds<Array>(); }
    [[nodiscard]] bool is_object() const { return holds<Object>(); }

    [[nodiscard]] bool get_bool() const { return get<bool>("bool"); }
    [[nodiscard]] int64_t get_int() const;
    [[nodiscard]] double get_double() const;
    [[nodiscard]] const std::string& get_string() const {
        return get<std::string>("string");
    }
    [[nodiscard]] const Array& get_array() const {
        return get<Array>("array");
    }
    [[nodiscard]] const Object& get_object() const {
        return get<Object>("object");
    }

    /// Object member lookup. Missing members and non-objects yield null.
    const JsonValue& operator[](const std::string& key) const;

    /// Object member insertion. Converts a null value into an object.
    JsonValue& operator[](const std::string& key);

    [[nodiscard]] bool has_key(const std::string& key) const;

    /// Appends to an array. Converts a null value into an array.
    void push_back(JsonValue val);

    [[nodiscard]] size_t size() const;

    bool operator==(const JsonValue& other) const {
        return storage_ == other.storage_;
    }

private:
    using Storage = std::variant<NullValue, bool, int64_t, double,
                                 std::string, Array, Object>;

    template <typename T>
    [[nodiscard]] bool holds() const {
        return std::holds_alternative<T>(storage_);
    }

    template <typename T>
    [[nodiscard]] const T& get(const char* kind) const {
        if (auto* p = std::get_if<T>(&storage_)) return *p;
        throw std::runtime_error(std::string("JsonValue: not a ") + kind);
    }

    Storage storage_;
};

/// Parse a JSON document. Malformed input yields PARSE_BAD_FORMAT.
[[nodiscard]] core::Result<JsonValue> parse_json(std::string_view input);

/// Serialize a JsonValue to compact JSON text.
[[nodiscard]] std::string json_serialize(const JsonValue& val);

} // namespace rpc

#endif // TXCOMBINE_RPC_JSON_H
