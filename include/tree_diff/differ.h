// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file differ.h
/// @brief Structural diff of two Values into an ordered list of changes.
///
/// Usage:
/// @code
///   Value a = from_json(R"({"a": 1, "b": {"b1": 1, "b2": 2}})");
///   Value b = from_json(R"({"a": 1, "b": {}})");
///
///   ChangeList changes = diff(a, b);
///   // - b.b1: 1
///   // - b.b2: 2
///
///   // Sequences of similar maps: try several alignments, keep the smallest
///   ChangeList best = best_diff(a, b);
/// @endcode
///
/// Output order (a fixed contract, patch tools apply entries in order):
///   - Maps: removed keys, then common keys recursively, then added keys;
///     each group sorted by key.
///   - Sequences (LCS): changes inside aligned elements first, then the
///     removals/additions between aligned elements, front to back. Removals
///     within one gap run from the back so earlier indices stay valid.
///
/// Added or removed map elements of a sequence are reported key by key: a
/// removal lists the element's keys and then removes the empty map left
/// behind; an addition inserts an empty map and then its keys.

#pragma once

#include <tree_diff/api.h>
#include <tree_diff/change.h>
#include <tree_diff/options.h>
#include <tree_diff/value.h>

#include <cstddef>
#include <vector>

namespace tree_diff {

// ============================================================
// Differ - diff engine bound to one validated option set
//
// The traversal runs on an explicit stack of frames instead of recursion,
// so input nesting does not consume call stack. Frames are popped in
// document order and their output is appended as they are processed.
// ============================================================

class TREE_DIFF_API Differ {
public:
    /// @throws invalid_options_error if options fail validation
    explicit Differ(DiffOptions options);

    /// Changes turning `lhs` into `rhs`
    /// @throws depth_limit_error if a value is nested deeper than options.max_depth
    [[nodiscard]] ChangeList diff(const Value& lhs, const Value& rhs) const;

    [[nodiscard]] const DiffOptions& options() const noexcept { return options_; }

private:
    /// One unit of pending work on the traversal stack
    struct Frame {
        enum class Kind {
            Compare,        ///< diff lhs against rhs
            RemovedKey,     ///< map key present only in lhs
            AddedKey,       ///< map key present only in rhs
            RemoveElement,  ///< sequence element dropped
            AddElement,     ///< sequence element inserted
            ModifyElement,  ///< unaligned scalar elements replaced in place
        };

        Kind kind;
        DiffPath path;
        Value lhs;
        Value rhs;
        std::size_t level;  ///< nesting level of the compared values, root = 0
    };

    /// Process frames in the given order, returning everything they emit
    [[nodiscard]] ChangeList run(std::vector<Frame> frames) const;

    void compare(const Frame& frame, std::vector<Frame>& pending, ChangeList& out) const;

    void diff_map(const Frame& frame, const ValueMap& lhs, const ValueMap& rhs,
                  std::vector<Frame>& children) const;

    /// Whole-sequence additions/removals when one side is empty
    void diff_array_degenerate(const Frame& frame, const ValueVector& lhs, const ValueVector& rhs,
                               std::vector<Frame>& children) const;

    void diff_array_lcs(const Frame& frame, const ValueVector& lhs, const ValueVector& rhs,
                        std::vector<Frame>& children) const;

    [[nodiscard]] ChangeList diff_array_linear(const Frame& frame, const ValueVector& lhs,
                                               const ValueVector& rhs) const;

    [[nodiscard]] ChangeList linear_forwards(const Frame& frame, const ValueVector& lhs,
                                             const ValueVector& rhs) const;

    [[nodiscard]] ChangeList linear_backwards(const Frame& frame, const ValueVector& lhs,
                                              const ValueVector& rhs) const;

    void push_added_element(const Frame& parent, std::size_t index, const Value& value,
                            std::vector<Frame>& children) const;

    void push_removed_element(const Frame& parent, std::size_t index, const Value& value,
                              std::vector<Frame>& children) const;

    DiffOptions options_;
};

/// Score of a candidate diff in best_diff; lower is better
enum class ChangeScore {
    EntryCount,     ///< number of entries
    NodeWeighted,   ///< weighted_change_count()
};

/// Diff `lhs` into `rhs`.
/// @throws invalid_options_error, depth_limit_error
[[nodiscard]] TREE_DIFF_API ChangeList diff(const Value& lhs, const Value& rhs,
                                            const DiffOptions& options = {});

/// Diff with a custom comparator (overrides options.comparator)
[[nodiscard]] TREE_DIFF_API ChangeList diff(const Value& lhs, const Value& rhs,
                                            const DiffOptions& options, Comparator comparator);

/// Diff at similarity 0.3, 0.5 and 0.8 and keep the lowest-scoring result;
/// ties go to the lower threshold. options.similarity is ignored.
[[nodiscard]] TREE_DIFF_API ChangeList best_diff(const Value& lhs, const Value& rhs,
                                                 const DiffOptions& options = {},
                                                 ChangeScore score = ChangeScore::EntryCount);

/// best_diff with a custom comparator (overrides options.comparator)
[[nodiscard]] TREE_DIFF_API ChangeList best_diff(const Value& lhs, const Value& rhs,
                                                 const DiffOptions& options, Comparator comparator);

/// Similarity thresholds tried by best_diff, in evaluation order
inline constexpr double best_diff_thresholds[] = {0.3, 0.5, 0.8};

} // namespace tree_diff
