//! # Common Definitions
//!
//! Shared vocabulary types for every maplint module.
//!
//! ## Overview
//!
//! - **Version Information**: tool version constants
//! - **Result Type**: recoverable errors as values
//! - **Smart Pointers**: `Box<T>` for unique ownership, `Rc<T>` for shared
//!
//! The analysis core never throws for expected failures. Loaders and parsers
//! return `Result<T, E>`; findings are returned as data.

#ifndef MAPLINT_COMMON_HPP
#define MAPLINT_COMMON_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace maplint {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Shared ownership pointer.
template <typename T> using Rc = std::shared_ptr<T>;

/// Creates a `Box<T>` from constructor arguments.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

/// Creates an `Rc<T>` from constructor arguments.
template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value `T` or an error `E`.
///
/// ```cpp
/// auto result = load_snapshot_file(path);
/// if (is_err(result)) {
///     report(unwrap_err(result));
///     return 2;
/// }
/// auto& snapshot = unwrap(result);
/// ```
template <typename T, typename E> using Result = std::variant<T, E>;

/// Returns true if the result holds a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Returns true if the result holds an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value. The result must be ok.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. The result must be an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

/// Helper for exhaustive `std::visit` arms guarded by `if constexpr`.
template <typename> inline constexpr bool always_false_v = false;

} // namespace maplint

#endif // MAPLINT_COMMON_HPP
