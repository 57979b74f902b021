// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_builder.h
/// @brief Locations of changes inside a compared Value.
///
/// A change is addressed in one of two forms, chosen by DiffOptions::array_path:
///
/// - **String path** (default): keys joined by the delimiter, indices in
///   brackets: `"a.b[2].c"`. An index on the root reads `"[2]"`.
/// - **Token path**: the raw sequence `{"a", "b", 2, "c"}`, for callers that
///   index back into the original structure programmatically.
///
/// One diff run never mixes the two forms.

#pragma once

#include "api.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tree_diff {

struct DiffOptions;

/// A single token: a map key or a sequence index
using PathElement = std::variant<std::string, std::size_t>;

/// Token form of a path
using PathTokens = std::vector<PathElement>;

/// A change location: delimited string or token sequence
using DiffPath = std::variant<std::string, PathTokens>;

/// Empty path of the form selected by options.array_path
[[nodiscard]] TREE_DIFF_API DiffPath root_path(const DiffOptions& options);

/// Path of the value stored under `key` in the map at `prefix`
[[nodiscard]] TREE_DIFF_API DiffPath append_key(const DiffPath& prefix, std::string_view key,
                                                const DiffOptions& options);

/// Path of the element at `index` in the sequence at `prefix`
[[nodiscard]] TREE_DIFF_API DiffPath append_index(const DiffPath& prefix, std::size_t index,
                                                  const DiffOptions& options);

/// Render either path form as text, e.g. for logs.
/// String paths are returned unchanged; token paths are joined with `delimiter`.
[[nodiscard]] TREE_DIFF_API std::string path_to_string(const DiffPath& path,
                                                       std::string_view delimiter = ".");

/// True for the empty string / empty token sequence
[[nodiscard]] TREE_DIFF_API bool is_root(const DiffPath& path) noexcept;

} // namespace tree_diff
