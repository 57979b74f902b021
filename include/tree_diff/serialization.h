// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text form of Value.
///
/// Usage:
/// @code
///   #include <tree_diff/serialization.h>
///
///   Value doc = from_json(R"({"a": 1, "b": [true, null]})");
///   std::string text = to_json(doc, true);   // compact
/// @endcode
///
/// Map keys are written in sorted order so the text of equal values is
/// identical regardless of how their maps were built.
///
/// Numbers: integers without fraction or exponent parse as int64, everything
/// else as double. This keeps the int/double distinction that strict
/// comparison relies on.

#pragma once

#include "api.h"
#include "value.h"

#include <string>

namespace tree_diff {

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
TREE_DIFF_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON string to Value
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure
/// @return Parsed Value, or null Value on parse error
TREE_DIFF_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

} // namespace tree_diff
