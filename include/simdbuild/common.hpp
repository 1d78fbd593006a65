//! # Common Definitions
//!
//! Common types and helpers shared by every simdbuild component.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version constants
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! Components never throw across module boundaries. Fallible operations
//! return `Result<T, E>` (a `std::variant`) and callers branch on `is_ok()`.

#ifndef SIMDBUILD_COMMON_HPP
#define SIMDBUILD_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace simdbuild {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.4.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 4;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<int, std::string> parse_level(std::string_view s) {
///     if (s.empty()) return std::string("empty level");
///     return 2;
/// }
///
/// auto result = parse_level("2");
/// if (is_ok(result)) {
///     int value = unwrap(result);
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

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

// ============================================================================
// Hashing
// ============================================================================

/// FNV-1a 64-bit offset basis.
constexpr uint64_t FNV_OFFSET_BASIS = 1469598103934665603ULL;

/// Folds `data` into a running FNV-1a 64-bit hash.
///
/// Used for every hash that is persisted to disk, so values stay stable
/// across tool builds and standard library implementations.
constexpr auto fnv1a64_update(uint64_t h, std::string_view data) -> uint64_t {
    constexpr uint64_t kPrime = 1099511628211ULL;
    for (unsigned char c : data) {
        h ^= static_cast<uint64_t>(c);
        h *= kPrime;
    }
    return h;
}

/// Formats a 64-bit value as 16 lowercase hex digits.
std::string hex16(uint64_t value);

} // namespace simdbuild

#endif // SIMDBUILD_COMMON_HPP
