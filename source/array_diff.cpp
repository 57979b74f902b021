// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// array_diff.cpp - Sequence alignment strategies of Differ

#include <tree_diff/differ.h>
#include <tree_diff/lcs.h>

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace tree_diff {

// ============================================================
// Element additions and removals
//
// A non-empty map element is expanded key by key, so similar maps that
// failed to align still produce fine-grained entries.
// ============================================================

void Differ::push_removed_element(const Frame& parent, std::size_t index, const Value& value,
                                  std::vector<Frame>& children) const
{
    DiffPath path = append_index(parent.path, index, options_);
    const std::size_t level = parent.level + 1;

    if (value.is_map() && value.size() > 0) {
        children.push_back(Frame{Frame::Kind::Compare, path, value, Value{ValueMap{}}, level});
        children.push_back(Frame{Frame::Kind::RemoveElement, std::move(path), Value{ValueMap{}}, Value{}, level});
        return;
    }
    children.push_back(Frame{Frame::Kind::RemoveElement, std::move(path), value, Value{}, level});
}

void Differ::push_added_element(const Frame& parent, std::size_t index, const Value& value,
                                std::vector<Frame>& children) const
{
    DiffPath path = append_index(parent.path, index, options_);
    const std::size_t level = parent.level + 1;

    if (value.is_map() && value.size() > 0) {
        children.push_back(Frame{Frame::Kind::AddElement, path, Value{}, Value{ValueMap{}}, level});
        children.push_back(Frame{Frame::Kind::Compare, std::move(path), Value{ValueMap{}}, value, level});
        return;
    }
    children.push_back(Frame{Frame::Kind::AddElement, std::move(path), Value{}, value, level});
}

void Differ::diff_array_degenerate(const Frame& frame, const ValueVector& lhs, const ValueVector& rhs,
                                   std::vector<Frame>& children) const
{
    if (lhs.size() == 0) {
        for (std::size_t i = 0; i < rhs.size(); ++i) {
            push_added_element(frame, i, rhs[i].get(), children);
        }
        return;
    }
    // Back to front so earlier indices stay valid
    for (std::size_t i = lhs.size(); i-- > 0;) {
        push_removed_element(frame, i, lhs[i].get(), children);
    }
}

// ============================================================
// LCS strategy
// ============================================================

void Differ::diff_array_lcs(const Frame& frame, const ValueVector& lhs, const ValueVector& rhs,
                            std::vector<Frame>& children) const
{
    auto pairs = match_subsequence(lhs, rhs, frame.path, options_);
    const std::size_t level = frame.level + 1;

    for (const auto& [li, ri] : pairs) {
        children.push_back(Frame{Frame::Kind::Compare, append_index(frame.path, li, options_),
                                 lhs[li].get(), rhs[ri].get(), level});
    }

    // Sentinel pair closes the trailing gap
    pairs.emplace_back(lhs.size(), rhs.size());

    std::ptrdiff_t last_x = -1;
    std::ptrdiff_t last_y = -1;
    for (const auto& [xu, yu] : pairs) {
        const auto x = static_cast<std::ptrdiff_t>(xu);
        const auto y = static_cast<std::ptrdiff_t>(yu);
        const std::ptrdiff_t removed = x - last_x - 1;
        const std::ptrdiff_t added = y - last_y - 1;

        // Position of the gap in the sequence being patched
        const auto base = static_cast<std::size_t>(last_y + 1);
        const auto first_removed = static_cast<std::size_t>(last_x + 1);
        const auto first_added = static_cast<std::size_t>(last_y + 1);

        // A scalar removed and a scalar added at the same position become one Modify
        const bool fold = removed > 0 && added > 0
                       && !lhs[first_removed]->is_container()
                       && !rhs[first_added]->is_container();

        for (std::ptrdiff_t k = removed - 1; k >= 0; --k) {
            const auto offset = static_cast<std::size_t>(k);
            const Value& old_value = lhs[first_removed + offset].get();
            if (fold && k == 0) {
                children.push_back(Frame{Frame::Kind::ModifyElement, append_index(frame.path, base, options_),
                                         old_value, rhs[first_added].get(), level});
            } else {
                push_removed_element(frame, base + offset, old_value, children);
            }
        }
        for (std::ptrdiff_t k = fold ? 1 : 0; k < added; ++k) {
            const auto offset = static_cast<std::size_t>(k);
            push_added_element(frame, base + offset, rhs[first_added + offset].get(), children);
        }

        last_x = x;
        last_y = y;
    }
}

// ============================================================
// Linear strategy
//
// Compares elements position by position, either aligned at the front or
// at the back; the surplus of the longer sequence is added or removed.
// The backward alignment wins only when strictly smaller.
// ============================================================

ChangeList Differ::diff_array_linear(const Frame& frame, const ValueVector& lhs,
                                     const ValueVector& rhs) const
{
    if (lhs.size() == rhs.size()) {
        return linear_forwards(frame, lhs, rhs);
    }
    ChangeList forwards = linear_forwards(frame, lhs, rhs);
    ChangeList backwards = linear_backwards(frame, lhs, rhs);
    return backwards.size() < forwards.size() ? backwards : forwards;
}

ChangeList Differ::linear_forwards(const Frame& frame, const ValueVector& lhs,
                                   const ValueVector& rhs) const
{
    std::vector<Frame> frames;
    const std::size_t common = std::min(lhs.size(), rhs.size());

    for (std::size_t i = 0; i < common; ++i) {
        frames.push_back(Frame{Frame::Kind::Compare, append_index(frame.path, i, options_),
                               lhs[i].get(), rhs[i].get(), frame.level + 1});
    }
    for (std::size_t i = lhs.size(); i-- > common;) {
        push_removed_element(frame, i, lhs[i].get(), frames);
    }
    for (std::size_t i = common; i < rhs.size(); ++i) {
        push_added_element(frame, i, rhs[i].get(), frames);
    }
    return run(std::move(frames));
}

ChangeList Differ::linear_backwards(const Frame& frame, const ValueVector& lhs,
                                    const ValueVector& rhs) const
{
    std::vector<Frame> frames;
    const std::size_t lhs_shift = rhs.size() > lhs.size() ? rhs.size() - lhs.size() : 0;
    const std::size_t rhs_shift = lhs.size() > rhs.size() ? lhs.size() - rhs.size() : 0;
    const std::size_t start = std::max(lhs_shift, rhs_shift);
    const std::size_t end = std::max(lhs.size(), rhs.size());

    for (std::size_t i = start; i < end; ++i) {
        const std::size_t li = i - lhs_shift;
        const std::size_t ri = i - rhs_shift;
        frames.push_back(Frame{Frame::Kind::Compare, append_index(frame.path, li, options_),
                               lhs[li].get(), rhs[ri].get(), frame.level + 1});
    }
    for (std::size_t i = 0; i < lhs_shift; ++i) {
        push_added_element(frame, i, rhs[i].get(), frames);
    }
    for (std::size_t i = rhs_shift; i-- > 0;) {
        push_removed_element(frame, i, lhs[i].get(), frames);
    }
    return run(std::move(frames));
}

} // namespace tree_diff
