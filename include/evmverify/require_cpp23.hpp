#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test macros for evmverify
 *
 * Fails the build early, with a readable message, when the standard library
 * lacks a C++23 facility the sources rely on. Included first by the CLI.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

// =============================================================================
// C++23 Language Standard Check
// =============================================================================

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "evmverify requires C++23 or later (__cplusplus >= 202302L)."
#endif

// =============================================================================
// std::print / std::println (__cpp_lib_print)
// =============================================================================
// Required for: CLI output and log lines

#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "evmverify requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Result<T> / VoidResult

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "evmverify requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::views::enumerate (__cpp_lib_ranges_enumerate)
// =============================================================================
// Required for: CLI argument parsing

#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "evmverify requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::format (__cpp_lib_format)
// =============================================================================

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "evmverify requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::ranges (__cpp_lib_ranges)
// =============================================================================

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "evmverify requires std::ranges (__cpp_lib_ranges >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::jthread (__cpp_lib_jthread)
// =============================================================================
// Required for: --jobs worker threads

#if !defined(__cpp_lib_jthread) || __cpp_lib_jthread < 201'911L
    #error "evmverify requires std::jthread (__cpp_lib_jthread >= 201911L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define EVMVERIFY_CPP23_FEATURES_VERIFIED 1
