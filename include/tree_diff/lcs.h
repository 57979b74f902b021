// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lcs.h
/// @brief Alignment of two sequences under a similarity predicate.
///
/// The differ keeps elements that are "similar enough" in place (diffing them
/// member by member) and reports the rest as additions and removals. Which
/// elements stay is decided here: a longest common subsequence where
/// "common" means similar() rather than equal.
///
/// Complexity: O(|a| * |b|) similarity checks, O(|a| * |b|) table memory.

#pragma once

#include <tree_diff/api.h>
#include <tree_diff/options.h>
#include <tree_diff/path_builder.h>
#include <tree_diff/value.h>

#include <cstddef>
#include <utility>
#include <vector>

namespace tree_diff {

/// (index in a, index in b)
using IndexPair = std::pair<std::size_t, std::size_t>;

/// Whether two sequence elements may be aligned with each other.
///
/// - Deeply equal values always may.
/// - Two maps may when the share of keys (over the union of both key sets)
///   holding deeply equal values is at least options.similarity.
/// - Anything else that is not equal may not.
///
/// @param path Path of lhs; handed to the custom comparator
[[nodiscard]] TREE_DIFF_API bool similar(const DiffPath& path, const Value& lhs, const Value& rhs,
                                         const DiffOptions& options);

/// Share of keys over the union of both maps whose values are deeply equal.
/// Two empty maps have similarity 1.
[[nodiscard]] TREE_DIFF_API double map_similarity(const DiffPath& path, const ValueMap& lhs,
                                                  const ValueMap& rhs, const DiffOptions& options);

/// Maximal monotonic matching of a and b under similar().
///
/// Pairs are strictly increasing in both indices. Among several maximal
/// matchings, the one with the most unmatched runs that start with a scalar on
/// both sides is returned; such a run is reported as a Modify followed by the
/// rest, so diff(a, b) and diff(b, a) have the same number of entries for
/// scalar sequences. Remaining ties drop an element of `a` first.
///
/// @param prefix Path of the sequence `a`; element paths are built from it
[[nodiscard]] TREE_DIFF_API std::vector<IndexPair> match_subsequence(const ValueVector& a,
                                                                     const ValueVector& b,
                                                                     const DiffPath& prefix,
                                                                     const DiffOptions& options);

} // namespace tree_diff
