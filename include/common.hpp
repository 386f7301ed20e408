//! # fwtest Common Definitions
//!
//! The harness version and the `Result` type every fallible harness step
//! returns. Harness code reports failures as values, not exceptions.
//!
//! | Helper        | Meaning                              |
//! |---------------|--------------------------------------|
//! | `is_ok`       | Holds the success value              |
//! | `is_err`      | Holds the error                      |
//! | `unwrap`      | Success value (`bad_variant_access`) |
//! | `unwrap_err`  | Error value (`bad_variant_access`)   |

#ifndef FWTEST_COMMON_HPP
#define FWTEST_COMMON_HPP

#include <string>
#include <variant>

namespace fwtest {

/// Printed by `fwtest --version`.
constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Result
// ============================================================================

/// Success value or error. Steps with nothing to return use
/// `Result<bool, HarnessError>` and yield `true`.
///
/// ```cpp
/// auto metadata = resolver.resolve(target);
/// if (is_err(metadata)) {
///     return unwrap_err(metadata);
/// }
/// const PlatformMetadata& facts = unwrap(metadata);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return result.index() == 0;
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return result.index() == 1;
}

template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<0>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<0>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<1>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<1>(result);
}

} // namespace fwtest

#endif // FWTEST_COMMON_HPP
