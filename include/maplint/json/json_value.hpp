//! # JSON Value Types
//!
//! The in-memory JSON tree used for snapshots and machine-readable reports.
//!
//! ```cpp
//! auto obj = json_object();
//! obj.set("name", json_string("Source"));
//! obj.set("members", json_array());
//! std::cout << obj.to_string_pretty() << "\n";
//! ```
//!
//! Objects are ordered maps, so serialization is deterministic.

#pragma once

#include "maplint/common.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace maplint::json {

struct JsonValue;

using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

/// A JSON number that remembers whether it was written as an integer.
struct JsonNumber {
    enum class Kind : uint8_t { Int64, Double };

    Kind kind = Kind::Int64;
    int64_t i64 = 0;
    double f64 = 0.0;

    JsonNumber() = default;
    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind == Kind::Int64;
    }

    [[nodiscard]] auto as_f64() const -> double {
        return kind == Kind::Int64 ? static_cast<double>(i64) : f64;
    }

    /// Integer view; doubles convert only when they hold a whole number.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t>;

    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool;
};

/// A JSON value. Arrays and objects are boxed to keep the variant finite.
struct JsonValue {
    using Null = std::monostate;
    using ValueVariant =
        std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>>;

    ValueVariant data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(double value) : data(JsonNumber(value)) {}
    explicit JsonValue(JsonNumber value) : data(value) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    JsonValue(JsonValue&&) noexcept = default;
    auto operator=(JsonValue&&) noexcept -> JsonValue& = default;
    JsonValue(const JsonValue&) = delete;
    auto operator=(const JsonValue&) -> JsonValue& = delete;

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // Accessors require the matching kind (checked with is_*).

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }
    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Looks up an object key. Returns nullptr if absent or not an object.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    /// Inserts or replaces an object key. No-op on non-objects.
    void set(const std::string& key, JsonValue value);

    /// Appends to an array. No-op on non-arrays.
    void push(JsonValue value);

    [[nodiscard]] auto size() const -> size_t;

    [[nodiscard]] auto clone() const -> JsonValue;

    [[nodiscard]] auto to_string() const -> std::string;
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_int(int64_t value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_float(double value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

// ============================================================================
// Serialization helpers
// ============================================================================

/// Escapes a string for inclusion between JSON quotes.
[[nodiscard]] auto escape_string(const std::string& s) -> std::string;

/// Shortest round-trippable text for a number.
[[nodiscard]] auto format_number(const JsonNumber& num) -> std::string;

} // namespace maplint::json
