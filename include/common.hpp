//! # Common Definitions
//!
//! Version constants, the `Result<T, E>` error-handling vocabulary and the
//! ownership aliases shared by every vcm module.
//!
//! Internal APIs do not throw across module boundaries: fallible operations
//! return `Result<T, E>` and callers branch on `is_ok` / `is_err`.

#ifndef VCM_COMMON_HPP
#define VCM_COMMON_HPP

#include <memory>
#include <string>
#include <variant>

namespace vcm {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.4.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 4;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// ```cpp
/// auto loaded = store.load("src/app.py");
/// if (is_err(loaded)) {
///     report(unwrap_err(loaded).to_string());
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Throws `std::bad_variant_access` if the Result holds an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Throws `std::bad_variant_access` if the Result holds a value.
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

/// Unique ownership of a heap value.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace vcm

#endif // VCM_COMMON_HPP
