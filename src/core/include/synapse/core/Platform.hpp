/**
 * @file Platform.hpp
 * @brief Branch-prediction hint.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef SYNAPSE_CORE_PLATFORM_HPP
    #define SYNAPSE_CORE_PLATFORM_HPP

    #if defined(__GNUC__) || defined(__clang__)
        #define SYNAPSE_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #else
        #define SYNAPSE_UNLIKELY(x) (x)
    #endif

#endif // SYNAPSE_CORE_PLATFORM_HPP
