// Copyright (c) 2024-2026 The txcombine Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/json.h"

#include <charconv>
#include <cmath>
#include <cstdio>

namespace rpc {

// ===========================================================================
// JsonValue
// ===========================================================================

int64_t JsonValue::get_int() const {
    if (auto* p = std::get_if<int64_t>(&storage_)) return *p;
    if (auto* p = std::get_if<double>(&storage_)) {
        return static_cast<int64_t>(*p);
    }
    throw std::runtime_error("JsonValue: not an integer");
}

double JsonValue::get_double() const {
    if (auto* p = std::get_if<double>(&storage_)) return *p;
    if (auto* p = std::get_if<int64_t>(&storage_)) {
        return static_cast<double>(*p);
    }
    throw std::runtime_error("JsonValue: not a number");
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    static const JsonValue null_val;
    const auto* obj = std::get_if<Object>(&storage_);
    if (!obj) return null_val;
    auto it = obj->find(key);
    return it != obj->end() ? it->second : null_val;
}

JsonValue& JsonValue::operator[](const std::string& key) {
    if (is_null()) storage_ = Object{};
    auto* obj = std::get_if<Object>(&storage_);
    if (!obj) throw std::runtime_error("JsonValue: not an object");
    return (*obj)[key];
}

bool JsonValue::has_key(const std::string& key) const {
    const auto* obj = std::get_if<Object>(&storage_);
    return obj && obj->count(key) > 0;
}

void JsonValue::push_back(JsonValue val) {
    if (is_null()) storage_ = Array{};
    auto* arr = std::get_if<Array>(&storage_);
    if (!arr) throw std::runtime_error("JsonValue: not an array");
    arr->push_back(std::move(val));
}

size_t JsonValue::size() const {
    if (auto* p = std::get_if<Array>(&storage_)) return p->size();
    if (auto* p = std::get_if<Object>(&storage_)) return p->size();
    if (auto* p = std::get_if<std::string>(&storage_)) return p->size();
    return 0;
}

// ===========================================================================
// Parser
// ===========================================================================

namespace {

// Nesting limit keeps a hostile reply from exhausting the stack.
constexpr int MAX_DEPTH = 512;

class JsonParser {
public:
    explicit JsonParser(std::string_view input) : in_(input) {}

    JsonValue parse_document() {
        JsonValue val = parse_value(0);
        skip_ws();
        if (pos_ != in_.size()) fail("trailing content after value");
        return val;
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("JSON: " + what + " at offset " +
                                 std::to_string(pos_));
    }

    bool at_end() const { return pos_ >= in_.size(); }

    char next() {
        if (at_end()) fail("unexpected end of input");
        return in_[pos_++];
    }

    void skip_ws() {
        while (!at_end()) {
            char c = in_[pos_];
            if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
            ++pos_;
        }
    }

    bool consume(char c) {
        skip_ws();
        if (!at_end() && in_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void expect(char c) {
        if (!consume(c)) fail(std::string("expected '") + c + "'");
    }

    void expect_literal(std::string_view lit) {
        if (in_.substr(pos_, lit.size()) != lit) fail("invalid literal");
        pos_ += lit.size();
    }

    JsonValue parse_value(int depth) {
        if (depth > MAX_DEPTH) fail("nesting too deep");
        skip_ws();
        if (at_end()) fail("unexpected end of input");

        switch (in_[pos_]) {
            case '{': return parse_object(depth);
            case '[': return parse_array(depth);
            case '"': return JsonValue(parse_string());
            case 't': expect_literal("true");  return JsonValue(true);
            case 'f': expect_literal("false"); return JsonValue(false);
            case 'n': expect_literal("null");  return JsonValue(nullptr);
            default:  return parse_number();
        }
    }

    void skip_digits() {
        while (!at_end() && in_[pos_] >= '0' && in_[pos_] <= '9') ++pos_;
    }

    bool at_digit() const {
        return !at_end() && in_[pos_] >= '0' && in_[pos_] <= '9';
    }

    JsonValue parse_number() {
        const size_t start = pos_;
        bool integral = true;

        if (!at_end() && in_[pos_] == '-') ++pos_;
        if (!at_digit()) fail("invalid number");
        if (in_[pos_] == '0') {
            ++pos_;
        } else {
            skip_digits();
        }
        if (!at_end() && in_[pos_] == '.') {
            integral = false;
            ++pos_;
            if (!at_digit()) fail("digit expected after decimal point");
            skip_digits();
        }
        if (!at_end() && (in_[pos_] == 'e' || in_[pos_] == 'E')) {
            integral = false;
            ++pos_;
            if (!at_end() && (in_[pos_] == '+' || in_[pos_] == '-')) ++pos_;
            if (!at_digit()) fail("digit expected in exponent");
            skip_digits();
        }

        const char* first = in_.data() + start;
        const char* last  = in_.data() + pos_;
        if (integral) {
            int64_t i = 0;
            auto [ptr, ec] = std::from_chars(first, last, i);
            if (ec == std::errc{} && ptr == last) return JsonValue(i);
            // Out of int64 range: fall through to double.
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec != std::errc{} || ptr != last) fail("unparsable number");
        return JsonValue(d);
    }

    uint32_t parse_hex4() {
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char h = next();
            cp <<= 4;
            if (h >= '0' && h <= '9')      cp |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
            else fail("invalid unicode escape");
        }
        return cp;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    std::string parse_string() {
        expect('"');
        std::string out;
        for (;;) {
            char c = next();
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            char esc = next();
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    uint32_t cp = parse_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (next() != '\\' || next() != 'u') {
                            fail("missing low surrogate");
                        }
                        uint32_t lo = parse_hex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) {
                            fail("invalid low surrogate");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    fail(std::string("invalid escape '\\") + esc + "'");
            }
        }
    }

    JsonValue parse_array(int depth) {
        expect('[');
        JsonValue::Array arr;
        if (consume(']')) return JsonValue(std::move(arr));
        do {
            arr.push_back(parse_value(depth + 1));
        } while (consume(','));
        expect(']');
        return JsonValue(std::move(arr));
    }

    JsonValue parse_object(int depth) {
        expect('{');
        JsonValue::Object obj;
        if (consume('}')) return JsonValue(std::move(obj));
        do {
            skip_ws();
            std::string key = parse_string();
            expect(':');
            obj[std::move(key)] = parse_value(depth + 1);
        } while (consume(','));
        expect('}');
        return JsonValue(std::move(obj));
    }

    std::string_view in_;
    size_t pos_ = 0;
};

// ===========================================================================
// Serializer
// ===========================================================================

void write_string(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void write_value(std::string& out, const JsonValue& val) {
    if (val.is_null()) {
        out += "null";
    } else if (val.is_bool()) {
        out += val.get_bool() ? "true" : "false";
    } else if (val.is_int()) {
        out += std::to_string(val.get_int());
    } else if (val.is_double()) {
        double d = val.get_double();
        if (!std::isfinite(d)) {
            out += "null";
        } else {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.17g", d);
            out += buf;
        }
    } else if (val.is_string()) {
        write_string(out, val.get_string());
    } else if (val.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& item : val.get_array()) {
            if (!first) out += ',';
            first = false;
            write_value(out, item);
        }
        out += ']';
    } else {
        out += '{';
        bool first = true;
        for (const auto& [key, item] : val.get_object()) {
            if (!first) out += ',';
            first = false;
            write_string(out, key);
            out += ':';
            write_value(out, item);
        }
        out += '}';
    }
}

} // namespace

core::Result<JsonValue> parse_json(std::string_view input) {
    try {
        return JsonParser(input).parse_document();
    } catch (const std::runtime_error& e) {
        return core::Error(core::ErrorCode::PARSE_BAD_FORMAT, e.what());
    }
}

std::string json_serialize(const JsonValue& val) {
    std::string out;
    write_value(out, val);
    return out;
}

} // namespace rpc
