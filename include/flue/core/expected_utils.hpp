#pragma once

#include <expected>
#include <utility>

namespace flue::core {

/**
 * @brief Utilities for working with std::expected to reduce boilerplate
 *
 * The macros below return early from the enclosing function with the error of
 * a failed std::expected, which must be convertible to the enclosing
 * function's error type.
 */
namespace expected_utils {

/**
 * @brief Assign-or-return helper
 *
 * Usage:
 *   FLUE_TRY_ASSIGN(value, some_expected_result);
 * Expands to:
 *   auto tmp = some_expected_result;
 *   if (!tmp) return std::unexpected(tmp.error());
 *   value = std::move(tmp.value());
 */
#define FLUE_TRY_ASSIGN(lhs, expr)                                                            \
    do {                                                                                      \
        auto flue_try_tmp = (expr);                                                           \
        if (!flue_try_tmp)                                                                    \
            return std::unexpected(flue_try_tmp.error());                                     \
        lhs = std::move(flue_try_tmp.value());                                                \
    } while (0)

/**
 * @brief FLUE_TRY_VOID macro for void expected results
 *
 * Usage: FLUE_TRY_VOID(some_void_expected_result);
 */
#define FLUE_TRY_VOID(expr)                                                                   \
    do {                                                                                      \
        auto flue_try_tmp_void = (expr);                                                      \
        if (!flue_try_tmp_void)                                                               \
            return std::unexpected(flue_try_tmp_void.error());                                \
    } while (0)

} // namespace expected_utils

} // namespace flue::core
