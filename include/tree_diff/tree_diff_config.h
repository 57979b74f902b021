// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file tree_diff_config.h
/// @brief Centralized compile-time configuration for tree_diff and immer.
///
/// This file MUST be seen before any immer header so that every translation
/// unit agrees on immer's settings. All tree_diff public headers include it
/// first, so users who only include tree_diff headers need nothing else.
///
/// tree_diff compares immutable values on a single thread; the immer settings
/// below are tuned for that.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(TREE_DIFF_CONFIGURED)
#error "immer headers were included before tree_diff/tree_diff_config.h. " \
       "Please include tree_diff headers before any direct immer includes."
#endif

#define TREE_DIFF_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Non-atomic reference counting and lock-free heap
///
/// Values handed to the differ are never shared across threads while a
/// diff is running.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief Disable tagged node assertions (smaller nodes)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// tree_diff Settings
// ============================================================

/// @brief Default nesting limit for DiffOptions::max_depth
///
/// Frames nested deeper than this many value levels abort the diff with
/// depth_limit_error.
#ifndef TREE_DIFF_DEFAULT_MAX_DEPTH
#define TREE_DIFF_DEFAULT_MAX_DEPTH 256
#endif

/// @brief Diagnostic logging to stderr
///
/// Enabled in debug builds, disabled when NDEBUG is defined.
/// Define TREE_DIFF_VERBOSE_LOG to 0 or 1 to force either way.
#ifndef TREE_DIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define TREE_DIFF_VERBOSE_LOG 0
#  else
#    define TREE_DIFF_VERBOSE_LOG 1
#  endif
#endif

#ifdef TREE_DIFF_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("tree_diff/immer: thread safety DISABLED")
#else
#pragma message("tree_diff/immer: thread safety ENABLED")
#endif
#endif // TREE_DIFF_CONFIG_VERBOSE
