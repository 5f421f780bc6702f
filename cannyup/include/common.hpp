//! # Common Definitions
//!
//! Types and constants shared by every cannyup component.
//!
//! ## Overview
//!
//! - **Version Information**: Installer version constants
//! - **Result Type**: Error handling without exceptions
//! - **Status**: A `Result` that carries no success value
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Environment**: Components receive a `ProcessEnvironment`
//!   value instead of reading or mutating the ambient process state

#ifndef CANNYUP_COMMON_HPP
#define CANNYUP_COMMON_HPP

#include <string>
#include <variant>

namespace cannyup {

// ============================================================================
// Version Information
// ============================================================================

/// The installer version string (e.g., "0.1.0").
constexpr const char* VERSION = "0.1.0";

/// Name of the executable this tool builds and installs.
constexpr const char* TARGET_BINARY = "canny";

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<ToolchainState, Error> state = probe.probe(spec, env);
/// if (is_err(state)) {
///     return unwrap_err(state);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

/// Success value for operations that only report failure.
using Unit = std::monostate;

} // namespace cannyup

#endif // CANNYUP_COMMON_HPP
