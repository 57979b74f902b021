// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// errors.h - Exceptions thrown by tree_diff

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tree_diff {

/// DiffOptions failed validation (similarity outside (0, 1],
/// negative or NaN numeric tolerance, zero max_depth).
/// Raised before any traversal starts.
class invalid_options_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// A compared value is nested deeper than DiffOptions::max_depth.
class depth_limit_error : public std::runtime_error {
public:
    depth_limit_error(const std::string& path, std::size_t limit)
        : std::runtime_error("nesting deeper than " + std::to_string(limit) + " levels at '" + path + "'")
        , path_(path)
        , limit_(limit)
    {}

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::size_t limit() const noexcept { return limit_; }

private:
    std::string path_;
    std::size_t limit_;
};

} // namespace tree_diff
