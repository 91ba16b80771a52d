/**
 * @file export.hpp
 * @brief Symbol visibility macros for mcdisc_core shared library.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(MCDISC_CORE_BUILD)
        #define MCDISC_CORE_API __declspec(dllexport)
    #elif defined(MCDISC_SHARED)
        #define MCDISC_CORE_API __declspec(dllimport)
    #else
        #define MCDISC_CORE_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(MCDISC_CORE_BUILD)
        #define MCDISC_CORE_API __attribute__((visibility("default")))
    #else
        #define MCDISC_CORE_API
    #endif
#else
    #define MCDISC_CORE_API
#endif
