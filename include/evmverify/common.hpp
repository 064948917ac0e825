#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: result types, path normalization, string helpers
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace evmverify {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace evmverify

namespace evmverify::common {

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Normalize a path for deterministic comparison
 * - Use '/' as separator
 * - Remove trailing slashes
 * - Resolve '..' and '.'
 * - Optionally make relative to repo_root
 *
 * Explorer-reported source paths ("./lib/foo/src/Bar.sol", "lib\\foo\\Bar.sol")
 * go through this before any prefix matching.
 *
 * @param input Input path
 * @param repo_root Optional repository root for relative paths
 * @return Normalized path
 */
[[nodiscard]] std::string normalize_path(std::string_view input, std::string_view repo_root = "");

/**
 * Check if path is absolute
 */
[[nodiscard]] bool is_absolute_path(std::string_view path);

/**
 * Split a normalized path into its non-empty components
 */
[[nodiscard]] std::vector<std::string> path_components(std::string_view path);

// ============================================================================
// String helpers
// ============================================================================

[[nodiscard]] std::string to_lower(std::string_view value);

[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs);

[[nodiscard]] std::string_view trim(std::string_view value);

}  // namespace evmverify::common
