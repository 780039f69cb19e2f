#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test macros for rfuri
 *
 * This header verifies at compile time that the standard library provides
 * the C++23 features rfuri relies on. It is included by the CLI entry point
 * so an insufficient toolchain fails with a clear message.
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
    #error "rfuri requires C++23 or later (__cplusplus >= 202302L)."
#endif

// =============================================================================
// std::print / std::println (__cpp_lib_print)
// =============================================================================
// Required for: Console output (replaces std::cout)

#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "rfuri requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Error handling (replaces exceptions)

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "rfuri requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::views::enumerate (__cpp_lib_ranges_enumerate)
// =============================================================================
// Required for: Indexed iteration (CLI argument parsing)

#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "rfuri requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::format (__cpp_lib_format)
// =============================================================================
// Required for: Report text and timestamps

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "rfuri requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// =============================================================================
// std::ranges (__cpp_lib_ranges)
// =============================================================================

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 202'110L
    #error "rfuri requires std::ranges (__cpp_lib_ranges >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define RFURI_CPP23_FEATURES_VERIFIED 1
