/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * SYNAPSE_TRY / SYNAPSE_TRY_VOID macros for early-return propagation.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef SYNAPSE_CORE_EXPECTED_HPP
    #define SYNAPSE_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace synapse::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace synapse::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type synapse::core::Expected<U>.
 */
#define SYNAPSE_TRY(expr)                                                 \
    ({                                                                     \
        auto &&_synapse_result = (expr);                                   \
        if (!_synapse_result.has_value()) [[unlikely]]                     \
            return std::unexpected(std::move(_synapse_result.error()));    \
        std::move(_synapse_result.value());                                \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type synapse::core::ExpectedVoid.
 */
#define SYNAPSE_TRY_VOID(expr)                                            \
    do {                                                                    \
        auto &&_synapse_result = (expr);                                   \
        if (!_synapse_result.has_value()) [[unlikely]]                     \
            return std::unexpected(std::move(_synapse_result.error()));    \
    } while (false)

#endif // SYNAPSE_CORE_EXPECTED_HPP
