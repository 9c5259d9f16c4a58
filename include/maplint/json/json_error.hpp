//! # JSON Error Types
//!
//! Parse errors with source positions, used when loading snapshots.

#pragma once

#include <cstddef>
#include <string>

namespace maplint::json {

/// An error found while parsing JSON text.
///
/// `line` and `column` are 1-based; zero means unknown.
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// "line X, column Y: message", dropping whatever location is unknown.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace maplint::json
