//! # JSON Value Implementation
//!
//! Lookup, mutation, cloning and equality for `JsonValue`.

#include "maplint/json/json_value.hpp"

#include <cmath>

namespace maplint::json {

auto JsonNumber::try_as_i64() const -> std::optional<int64_t> {
    if (kind == Kind::Int64) {
        return i64;
    }
    if (std::isfinite(f64) && std::trunc(f64) == f64 && std::fabs(f64) < 9.2e18) {
        return static_cast<int64_t>(f64);
    }
    return std::nullopt;
}

auto JsonNumber::operator==(const JsonNumber& other) const -> bool {
    if (kind == Kind::Int64 && other.kind == Kind::Int64) {
        return i64 == other.i64;
    }
    return as_f64() == other.as_f64();
}

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    if (!is_object()) {
        return nullptr;
    }
    const auto& obj = as_object();
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
}

void JsonValue::set(const std::string& key, JsonValue value) {
    if (!is_object()) {
        return;
    }
    as_object_mut().insert_or_assign(key, std::move(value));
}

void JsonValue::push(JsonValue value) {
    if (!is_array()) {
        return;
    }
    as_array_mut().push_back(std::move(value));
}

auto JsonValue::size() const -> size_t {
    if (is_array()) {
        return as_array().size();
    }
    if (is_object()) {
        return as_object().size();
    }
    return 0;
}

auto JsonValue::clone() const -> JsonValue {
    if (is_array()) {
        JsonArray copy;
        copy.reserve(as_array().size());
        for (const auto& item : as_array()) {
            copy.push_back(item.clone());
        }
        return JsonValue(std::move(copy));
    }
    if (is_object()) {
        JsonObject copy;
        for (const auto& [key, item] : as_object()) {
            copy.emplace(key, item.clone());
        }
        return JsonValue(std::move(copy));
    }
    if (is_bool()) {
        return JsonValue(as_bool());
    }
    if (is_number()) {
        return JsonValue(as_number());
    }
    if (is_string()) {
        return JsonValue(as_string());
    }
    return JsonValue();
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_number()) {
        return as_number() == other.as_number();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        const auto& a = as_array();
        const auto& b = other.as_array();
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (!(a[i] == b[i])) {
                return false;
            }
        }
        return true;
    }
    const auto& a = as_object();
    const auto& b = other.as_object();
    if (a.size() != b.size()) {
        return false;
    }
    for (auto ia = a.begin(), ib = b.begin(); ia != a.end(); ++ia, ++ib) {
        if (ia->first != ib->first || !(ia->second == ib->second)) {
            return false;
        }
    }
    return true;
}

} // namespace maplint::json
