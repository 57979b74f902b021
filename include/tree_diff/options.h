// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file options.h
/// @brief Comparison options and the custom comparator hook.
///
/// DiffOptions is built once per diff and passed by const reference to every
/// comparison. Nothing inside the differ mutates it; best_diff copies it once
/// per similarity threshold.
///
/// @code
///   DiffOptions opts;
///   opts.strict = false;              // 1 == 1.0
///   opts.numeric_tolerance = 0.01;
///   opts.comparator = [](const DiffPath& path, const Value& a, const Value& b) {
///       if (path_to_string(path) == "meta.updated_at") return Verdict::equal();
///       return Verdict::defer();
///   };
///   auto changes = diff(old_doc, new_doc, opts);
/// @endcode

#pragma once

#include <tree_diff/api.h>
#include <tree_diff/change.h>
#include <tree_diff/path_builder.h>
#include <tree_diff/tree_diff_config.h>
#include <tree_diff/value.h>

#include <cstddef>
#include <functional>
#include <string>

namespace tree_diff {

// ============================================================
// Verdict - result of a custom comparator
//
//   Equal      the two values are the same; nothing is reported
//   NotEqual   report a single Modify of the whole value
//   Replace    report exactly the given changes instead
//   Defer      no opinion; use the default comparison
// ============================================================

class Verdict {
public:
    enum class Kind { Equal, NotEqual, Replace, Defer };

    [[nodiscard]] static Verdict equal() { return Verdict{Kind::Equal, {}}; }
    [[nodiscard]] static Verdict not_equal() { return Verdict{Kind::NotEqual, {}}; }
    [[nodiscard]] static Verdict replace(ChangeList changes) { return Verdict{Kind::Replace, std::move(changes)}; }
    [[nodiscard]] static Verdict defer() { return Verdict{Kind::Defer, {}}; }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_defer() const noexcept { return kind_ == Kind::Defer; }
    [[nodiscard]] const ChangeList& changes() const noexcept { return changes_; }

private:
    Verdict(Kind kind, ChangeList changes) : kind_(kind), changes_(std::move(changes)) {}

    Kind kind_;
    ChangeList changes_;
};

/// Custom comparator, consulted before the default logic at every compared node.
///
/// Receives the node's path and both sides; a side that does not exist (key
/// added or removed) is passed as null. Must be free of side effects: it may
/// be called many times for the same node while arrays are being aligned.
/// Exceptions it throws abort the diff and reach the caller unchanged.
using Comparator = std::function<Verdict(const DiffPath& path, const Value& lhs, const Value& rhs)>;

struct TREE_DIFF_API DiffOptions {
    /// Scalars of different numeric types (int vs double) are never equal
    bool strict = true;

    /// Minimum fraction of equal keys for two maps in sequences to be aligned, in (0, 1]
    double similarity = 0.8;

    /// Separator between keys in string paths
    std::string delimiter = ".";

    /// Numbers within this distance compare equal, >= 0
    double numeric_tolerance = 0.0;

    /// Trim leading/trailing whitespace of strings before comparing
    bool strip = false;

    /// Report paths as token sequences instead of strings
    bool array_path = false;

    /// Align sequences with the subsequence matcher; false selects the linear strategy
    bool use_lcs = true;

    /// Deepest value nesting accepted before depth_limit_error
    std::size_t max_depth = TREE_DIFF_DEFAULT_MAX_DEPTH;

    /// Optional custom comparator (empty = none)
    Comparator comparator;

    /// Throws invalid_options_error when a field is out of range
    void validate() const;

    /// Copy with a different similarity threshold
    [[nodiscard]] DiffOptions with_similarity(double value) const;
};

/// Ask the custom comparator, if any, about a node. Returns Verdict::defer()
/// when no comparator is configured.
[[nodiscard]] TREE_DIFF_API Verdict consult_comparator(const DiffPath& path, const Value& lhs,
                                                       const Value& rhs, const DiffOptions& options);

} // namespace tree_diff
