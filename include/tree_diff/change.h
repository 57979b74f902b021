// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// change.h - Change entries produced by the differ

#pragma once

#include <tree_diff/api.h>
#include <tree_diff/path_builder.h>
#include <tree_diff/value.h>

#include <string>
#include <utility>
#include <vector>

namespace tree_diff {

/// One atomic edit turning the old value into the new one.
///
/// - Add:    new_value is meaningful, old_value is null
/// - Remove: old_value is meaningful, new_value is null
/// - Modify: both are meaningful (either may itself be null)
struct ChangeEntry {
    enum class Op { Add, Remove, Modify };

    Op op = Op::Add;
    DiffPath path;
    Value old_value;
    Value new_value;

    [[nodiscard]] static ChangeEntry add(DiffPath path, Value value) {
        return ChangeEntry{Op::Add, std::move(path), Value{}, std::move(value)};
    }

    [[nodiscard]] static ChangeEntry remove(DiffPath path, Value value) {
        return ChangeEntry{Op::Remove, std::move(path), std::move(value), Value{}};
    }

    [[nodiscard]] static ChangeEntry modify(DiffPath path, Value old_value, Value new_value) {
        return ChangeEntry{Op::Modify, std::move(path), std::move(old_value), std::move(new_value)};
    }

    /// The value that was added/removed, or the new value of a Modify
    [[nodiscard]] const Value& value() const {
        return op == Op::Remove ? old_value : new_value;
    }

    /// Opcode symbol of the record form: '+', '-' or '~'
    [[nodiscard]] char opcode() const noexcept;

    /// The same edit in the other direction: Add <-> Remove, Modify sides swapped
    [[nodiscard]] ChangeEntry inverted() const;

    bool operator==(const ChangeEntry& other) const {
        return op == other.op && path == other.path
            && old_value == other.old_value && new_value == other.new_value;
    }
};

using ChangeList = std::vector<ChangeEntry>;

// ============================================================
// Record form
//
// Each entry becomes a sequence Value:
//   ["+", path, value]  ["-", path, value]  ["~", path, old, new]
// where path is a string, or a sequence of strings and integers.
// ============================================================

[[nodiscard]] TREE_DIFF_API Value to_value(const DiffPath& path);
[[nodiscard]] TREE_DIFF_API Value to_value(const ChangeEntry& entry);
[[nodiscard]] TREE_DIFF_API Value to_value(const ChangeList& changes);

/// JSON text of the record form of `changes`
[[nodiscard]] TREE_DIFF_API std::string to_json(const ChangeList& changes, bool compact = false);

/// One-line rendering: `~ a.b: 1 -> 2`
[[nodiscard]] TREE_DIFF_API std::string change_to_string(const ChangeEntry& entry);

/// Print every entry on its own line to stdout
TREE_DIFF_API void print_changes(const ChangeList& changes);

// ============================================================
// Sizing
// ============================================================

/// Number of scalar leaves under `val`. Null counts 0, containers the sum of
/// their children, any other scalar 1.
[[nodiscard]] TREE_DIFF_API std::size_t count_nodes(const Value& val);

/// Size of a change list weighted by content: a Modify counts 2, an
/// Add/Remove counts the leaves of its value.
[[nodiscard]] TREE_DIFF_API std::size_t weighted_change_count(const ChangeList& changes);

} // namespace tree_diff
