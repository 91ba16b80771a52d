/**
 * @file export.hpp
 * @brief Symbol visibility macros for mcdisc_utils shared library.
 *
 * This header provides the MCDISC_UTILS_API macro for cross-platform
 * shared library symbol export/import.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(MCDISC_UTILS_BUILD)
        #define MCDISC_UTILS_API __declspec(dllexport)
    #elif defined(MCDISC_SHARED)
        #define MCDISC_UTILS_API __declspec(dllimport)
    #else
        #define MCDISC_UTILS_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(MCDISC_UTILS_BUILD)
        #define MCDISC_UTILS_API __attribute__((visibility("default")))
    #else
        #define MCDISC_UTILS_API
    #endif
#else
    #define MCDISC_UTILS_API
#endif
