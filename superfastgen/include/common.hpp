//! # Common Definitions
//!
//! Shared types and helpers used by every SuperFastGen component.
//!
//! ## Overview
//!
//! - **Version Information**: generator version constants
//! - **Source Locations**: positions and spans inside Dart sources
//! - **Result Type**: error handling without exceptions
//! - **Smart Pointers**: aliases for unique and shared ownership
//!
//! ## Conventions
//!
//! - **No Exceptions**: fallible operations return `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared

#ifndef SFG_COMMON_HPP
#define SFG_COMMON_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sfg {

// ============================================================================
// Version Information
// ============================================================================

/// The generator version string.
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Source Location Types
// ============================================================================

/// A position in a Dart source file.
///
/// # Fields
///
/// - `file`: path of the source file (borrowed from the owning `Source`)
/// - `line`: 1-based line number
/// - `column`: 1-based column number
/// - `offset`: 0-based byte offset from file start
/// - `length`: length of the element in bytes
struct SourceLocation {
    std::string_view file;
    uint32_t line;
    uint32_t column;
    uint32_t offset;
    uint32_t length;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A contiguous region of source code.
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;

    /// Merges two spans into one running from the start of `a` to the end of `b`.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }
};

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// ```cpp
/// auto result = parser.parse_unit();
/// if (is_err(result)) {
///     for (const auto& e : unwrap_err(result)) report(e);
/// }
/// ```
///
/// `T` and `E` must be distinct types.
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value. Throws `std::bad_variant_access` on an error value.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. Throws `std::bad_variant_access` on a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace sfg

#endif // SFG_COMMON_HPP
