// api.h - DLL export/import macros for tree_diff

#pragma once

/// @file api.h
/// @brief Cross-platform export/import macros for the tree_diff library.
///
/// Usage:
/// - When building tree_diff as a SHARED library:
///   - CMake defines TREE_DIFF_EXPORTS (private) and TREE_DIFF_SHARED (public)
///   - Functions/classes marked with TREE_DIFF_API are exported
///
/// - When using tree_diff as a SHARED library:
///   - Link against the tree_diff target (CMake propagates TREE_DIFF_SHARED)
///
/// - When building/using as a STATIC library (the default):
///   - TREE_DIFF_API expands to nothing

#if defined(_WIN32) || defined(_WIN64)
    #ifdef TREE_DIFF_SHARED
        #ifdef TREE_DIFF_EXPORTS
            #define TREE_DIFF_API __declspec(dllexport)
        #else
            #define TREE_DIFF_API __declspec(dllimport)
        #endif
    #else
        #define TREE_DIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(TREE_DIFF_SHARED) && defined(TREE_DIFF_EXPORTS)
        #define TREE_DIFF_API __attribute__((visibility("default")))
    #else
        #define TREE_DIFF_API
    #endif
#else
    #define TREE_DIFF_API
#endif
