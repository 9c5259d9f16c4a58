//! # JSON Serialization
//!
//! Compact and indented output for `JsonValue`.

#include "maplint/json/json_value.hpp"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace maplint::json {

auto escape_string(const std::string& s) -> std::string {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    return out;
}

auto format_number(const JsonNumber& num) -> std::string {
    if (num.is_integer()) {
        return std::to_string(num.i64);
    }
    if (std::isnan(num.f64) || std::isinf(num.f64)) {
        return "null";
    }
    std::ostringstream oss;
    oss.precision(17);
    oss << num.f64;
    std::string text = oss.str();
    // Keep doubles recognisable as doubles on re-parse.
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

namespace {

void serialize(const JsonValue& value, std::string& out, int indent, int depth) {
    if (value.is_null()) {
        out += "null";
        return;
    }
    if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
        return;
    }
    if (value.is_number()) {
        out += format_number(value.as_number());
        return;
    }
    if (value.is_string()) {
        out += '"';
        out += escape_string(value.as_string());
        out += '"';
        return;
    }

    bool pretty = indent > 0;
    std::string inner(pretty ? static_cast<size_t>((depth + 1) * indent) : 0, ' ');
    std::string outer(pretty ? static_cast<size_t>(depth * indent) : 0, ' ');

    if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            out += "[]";
            return;
        }
        out += pretty ? "[\n" : "[";
        for (size_t i = 0; i < arr.size(); ++i) {
            out += inner;
            serialize(arr[i], out, indent, depth + 1);
            if (i + 1 < arr.size()) {
                out += ',';
            }
            if (pretty) {
                out += '\n';
            }
        }
        out += outer;
        out += ']';
        return;
    }

    const auto& obj = value.as_object();
    if (obj.empty()) {
        out += "{}";
        return;
    }
    out += pretty ? "{\n" : "{";
    size_t i = 0;
    for (const auto& [key, item] : obj) {
        out += inner;
        out += '"';
        out += escape_string(key);
        out += pretty ? "\": " : "\":";
        serialize(item, out, indent, depth + 1);
        if (++i < obj.size()) {
            out += ',';
        }
        if (pretty) {
            out += '\n';
        }
    }
    out += outer;
    out += '}';
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize(*this, out, 0, 0);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize(*this, out, indent, 0);
    return out;
}

} // namespace maplint::json
