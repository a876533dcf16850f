/**
 * @file export.hpp
 * @brief Symbol visibility macros for the meshscout libraries.
 *
 * Each library target defines MESHSCOUT_<LIB>_BUILD while it is being
 * compiled so that its API macro expands to the export attribute; users
 * of the library get the import attribute (or nothing on GCC/Clang).
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #define MESHSCOUT_SYMBOL_EXPORT __declspec(dllexport)
    #define MESHSCOUT_SYMBOL_IMPORT __declspec(dllimport)
#elif defined(__GNUC__) || defined(__clang__)
    #define MESHSCOUT_SYMBOL_EXPORT __attribute__((visibility("default")))
    #define MESHSCOUT_SYMBOL_IMPORT
#else
    #define MESHSCOUT_SYMBOL_EXPORT
    #define MESHSCOUT_SYMBOL_IMPORT
#endif

// Static builds need neither attribute.
#if defined(MESHSCOUT_STATIC)
    #define MESHSCOUT_UTILS_API
    #define MESHSCOUT_CORE_API
    #define MESHSCOUT_TRANSPORT_API
#else
    #if defined(MESHSCOUT_UTILS_BUILD)
        #define MESHSCOUT_UTILS_API MESHSCOUT_SYMBOL_EXPORT
    #else
        #define MESHSCOUT_UTILS_API MESHSCOUT_SYMBOL_IMPORT
    #endif

    #if defined(MESHSCOUT_CORE_BUILD)
        #define MESHSCOUT_CORE_API MESHSCOUT_SYMBOL_EXPORT
    #else
        #define MESHSCOUT_CORE_API MESHSCOUT_SYMBOL_IMPORT
    #endif

    #if defined(MESHSCOUT_TRANSPORT_BUILD)
        #define MESHSCOUT_TRANSPORT_API MESHSCOUT_SYMBOL_EXPORT
    #else
        #define MESHSCOUT_TRANSPORT_API MESHSCOUT_SYMBOL_IMPORT
    #endif
#endif
