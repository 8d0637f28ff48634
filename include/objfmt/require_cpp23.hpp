#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for objfmt
 *
 * Verifies at compile time that the standard library provides the C++23
 * features objfmt relies on. Include early in a translation unit to get a
 * clear error when the toolchain is insufficient.
 *
 * Required compiler versions:
 *   - GCC 14.0+
 *   - Clang 19.0+
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "objfmt requires C++23 or later (__cplusplus >= 202302L)."
#endif

// std::print / std::println: command-line diagnostics
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "objfmt requires std::print/std::println (__cpp_lib_print >= 202207L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::expected: Result<T> error model
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "objfmt requires std::expected (__cpp_lib_expected >= 202202L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::views::enumerate: indexed walks over sequences
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "objfmt requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::rotr: SHA-256 rounds
#if !defined(__cpp_lib_bitops) || __cpp_lib_bitops < 201'907L
    #error "objfmt requires <bit> bit operations (__cpp_lib_bitops >= 201907L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

// std::format: error messages and JSON paths
#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "objfmt requires std::format (__cpp_lib_format >= 202110L). " \
       "Please use GCC 14+ or Clang 19+ with a compatible standard library."
#endif

#define OBJFMT_CPP23_FEATURES_VERIFIED 1
