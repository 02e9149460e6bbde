/**
 * @file Assert.hpp
 * @brief Debug assertions with source location.
 *
 * SYNAPSE_ASSERT is evaluated only when SYNAPSE_DEBUG is defined; it logs
 * the failing expression together with the file, line and function before
 * aborting.  In release builds it is a no-op.  Assertions guard internal
 * invariants only, never recoverable conditions.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef SYNAPSE_CORE_ASSERT_HPP
    #define SYNAPSE_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace synapse::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[SYNAPSE ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace synapse::core::detail

    #ifdef SYNAPSE_DEBUG
        #define SYNAPSE_ASSERT(cond)                                      \
            do {                                                           \
                if (SYNAPSE_UNLIKELY(!(cond)))                             \
                    ::synapse::core::detail::assertFail(#cond);            \
            } while (false)
    #else
        #define SYNAPSE_ASSERT(cond) ((void)0)
    #endif

#endif // SYNAPSE_CORE_ASSERT_HPP
