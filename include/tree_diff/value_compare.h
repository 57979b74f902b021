// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value_compare.h - Equality rules applied by the differ

#pragma once

#include <tree_diff/api.h>
#include <tree_diff/options.h>
#include <tree_diff/path_builder.h>
#include <tree_diff/value.h>

#include <string_view>

namespace tree_diff {

/// Whether two values may be compared member by member.
///
/// True for two maps, two sequences, two scalars of the same type, and
/// (when `strict` is false) any two numbers. Anything else is reported as a
/// single Modify of the whole value.
[[nodiscard]] TREE_DIFF_API bool comparable(const Value& lhs, const Value& rhs, bool strict) noexcept;

/// Scalar equality under the comparison options.
///
/// - Two numbers: equal when |lhs - rhs| <= numeric_tolerance (exact for two
///   integers with zero tolerance)
/// - Two strings with `strip`: compared after trimming whitespace
/// - Otherwise: same type and same value
///
/// Type compatibility (strict mode) is comparable()'s job, not this one's.
[[nodiscard]] TREE_DIFF_API bool compare_values(const Value& lhs, const Value& rhs,
                                                const DiffOptions& options);

/// Deep equality under the comparison options, custom comparator included.
///
/// Two values are deeply equal when diff(lhs, rhs, options) would report
/// nothing, except that sequences are compared position by position.
/// Runs on an explicit stack and stops at the first difference.
[[nodiscard]] TREE_DIFF_API bool values_equal(const DiffPath& path, const Value& lhs, const Value& rhs,
                                              const DiffOptions& options);

/// Whether a key present in only one map counts as unchanged.
///
/// The missing side is passed as null. Only a custom comparator can accept
/// it (Equal, or Replace with an empty list); otherwise the key differs.
[[nodiscard]] TREE_DIFF_API bool one_sided_key_equal(const DiffPath& path, const Value& lhs,
                                                     const Value& rhs, const DiffOptions& options);

namespace detail {
    [[nodiscard]] std::string_view trim(std::string_view text) noexcept;
}

} // namespace tree_diff
