// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// differ.cpp - Differ traversal, map diff and best_diff

#include <tree_diff/differ.h>
#include <tree_diff/errors.h>
#include <tree_diff/value_compare.h>

#include <algorithm>
#include <string>
#include <utility>

namespace tree_diff {

namespace {

// Apply a non-deferring verdict; returns false when the default logic must run
bool apply_verdict(const Verdict& verdict, const DiffPath& path, const Value& lhs, const Value& rhs,
                   ChangeList& out)
{
    switch (verdict.kind()) {
        case Verdict::Kind::Equal:
            return true;
        case Verdict::Kind::NotEqual:
            out.push_back(ChangeEntry::modify(path, lhs, rhs));
            return true;
        case Verdict::Kind::Replace:
            out.insert(out.end(), verdict.changes().begin(), verdict.changes().end());
            return true;
        case Verdict::Kind::Defer:
            break;
    }
    return false;
}

std::vector<std::string> sorted_keys(const ValueMap& map)
{
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [key, value] : map) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // anonymous namespace

// ============================================================
// Differ
// ============================================================

Differ::Differ(DiffOptions options)
    : options_(std::move(options))
{
    options_.validate();
}

ChangeList Differ::diff(const Value& lhs, const Value& rhs) const
{
    std::vector<Frame> frames;
    frames.push_back(Frame{Frame::Kind::Compare, root_path(options_), lhs, rhs, 0});
    return run(std::move(frames));
}

ChangeList Differ::run(std::vector<Frame> frames) const
{
    ChangeList out;

    // The stack pops from the back
    std::vector<Frame> pending(std::make_move_iterator(frames.rbegin()),
                               std::make_move_iterator(frames.rend()));

    while (!pending.empty()) {
        Frame frame = std::move(pending.back());
        pending.pop_back();

        switch (frame.kind) {
            case Frame::Kind::Compare:
                compare(frame, pending, out);
                break;
            case Frame::Kind::RemovedKey: {
                auto verdict = consult_comparator(frame.path, frame.lhs, frame.rhs, options_);
                if (!apply_verdict(verdict, frame.path, frame.lhs, frame.rhs, out)) {
                    out.push_back(ChangeEntry::remove(std::move(frame.path), std::move(frame.lhs)));
                }
                break;
            }
            case Frame::Kind::AddedKey: {
                auto verdict = consult_comparator(frame.path, frame.lhs, frame.rhs, options_);
                if (!apply_verdict(verdict, frame.path, frame.lhs, frame.rhs, out)) {
                    out.push_back(ChangeEntry::add(std::move(frame.path), std::move(frame.rhs)));
                }
                break;
            }
            case Frame::Kind::RemoveElement:
                out.push_back(ChangeEntry::remove(std::move(frame.path), std::move(frame.lhs)));
                break;
            case Frame::Kind::AddElement:
                out.push_back(ChangeEntry::add(std::move(frame.path), std::move(frame.rhs)));
                break;
            case Frame::Kind::ModifyElement:
                out.push_back(ChangeEntry::modify(std::move(frame.path), std::move(frame.lhs),
                                                  std::move(frame.rhs)));
                break;
        }
    }
    return out;
}

void Differ::compare(const Frame& frame, std::vector<Frame>& pending, ChangeList& out) const
{
    if (frame.level > options_.max_depth) {
        const auto where = path_to_string(frame.path, options_.delimiter);
        detail::log_access_error("Differ", "nesting limit exceeded at '" + where + "'");
        throw depth_limit_error(where, options_.max_depth);
    }

    const Value& lhs = frame.lhs;
    const Value& rhs = frame.rhs;

    if (apply_verdict(consult_comparator(frame.path, lhs, rhs, options_), frame.path, lhs, rhs, out)) {
        return;
    }

    if (lhs.is_null() && rhs.is_null()) {
        return;
    }
    if (lhs.is_null() || rhs.is_null() || !comparable(lhs, rhs, options_.strict)) {
        out.push_back(ChangeEntry::modify(frame.path, lhs, rhs));
        return;
    }

    std::vector<Frame> children;

    if (auto* lv = lhs.get_if<ValueVector>()) {
        const auto& rv = *rhs.get_if<ValueVector>();
        if (lv->size() == 0 || rv.size() == 0) {
            diff_array_degenerate(frame, *lv, rv, children);
        } else if (options_.use_lcs) {
            diff_array_lcs(frame, *lv, rv, children);
        } else {
            auto changes = diff_array_linear(frame, *lv, rv);
            out.insert(out.end(), std::make_move_iterator(changes.begin()),
                       std::make_move_iterator(changes.end()));
            return;
        }
    } else if (auto* lm = lhs.get_if<ValueMap>()) {
        diff_map(frame, *lm, *rhs.get_if<ValueMap>(), children);
    } else {
        if (!compare_values(lhs, rhs, options_)) {
            out.push_back(ChangeEntry::modify(frame.path, lhs, rhs));
        }
        return;
    }

    // Children are collected in document order
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        pending.push_back(std::move(*it));
    }
}

void Differ::diff_map(const Frame& frame, const ValueMap& lhs, const ValueMap& rhs,
                      std::vector<Frame>& children) const
{
    const auto lhs_keys = sorted_keys(lhs);
    const auto rhs_keys = sorted_keys(rhs);
    const std::size_t level = frame.level + 1;

    for (const auto& key : lhs_keys) {
        if (!rhs.find(key)) {
            children.push_back(Frame{Frame::Kind::RemovedKey, append_key(frame.path, key, options_),
                                     lhs.find(key)->get(), Value{}, level});
        }
    }
    for (const auto& key : lhs_keys) {
        if (auto* found = rhs.find(key)) {
            children.push_back(Frame{Frame::Kind::Compare, append_key(frame.path, key, options_),
                                     lhs.find(key)->get(), found->get(), level});
        }
    }
    for (const auto& key : rhs_keys) {
        if (!lhs.find(key)) {
            children.push_back(Frame{Frame::Kind::AddedKey, append_key(frame.path, key, options_),
                                     Value{}, rhs.find(key)->get(), level});
        }
    }
}

// ============================================================
// Free functions
// ============================================================

ChangeList diff(const Value& lhs, const Value& rhs, const DiffOptions& options)
{
    return Differ{options}.diff(lhs, rhs);
}

ChangeList diff(const Value& lhs, const Value& rhs, const DiffOptions& options, Comparator comparator)
{
    DiffOptions with_comparator = options;
    with_comparator.comparator = std::move(comparator);
    return Differ{std::move(with_comparator)}.diff(lhs, rhs);
}

ChangeList best_diff(const Value& lhs, const Value& rhs, const DiffOptions& options, ChangeScore score)
{
    ChangeList best;
    std::size_t best_score = 0;
    bool have_best = false;

    for (double threshold : best_diff_thresholds) {
        ChangeList candidate = Differ{options.with_similarity(threshold)}.diff(lhs, rhs);
        const std::size_t candidate_score = score == ChangeScore::EntryCount
                                                ? candidate.size()
                                                : weighted_change_count(candidate);
        if (!have_best || candidate_score < best_score) {
            best = std::move(candidate);
            best_score = candidate_score;
            have_best = true;
        }
    }
    return best;
}

ChangeList best_diff(const Value& lhs, const Value& rhs, const DiffOptions& options, Comparator comparator)
{
    DiffOptions with_comparator = options;
    with_comparator.comparator = std::move(comparator);
    return best_diff(lhs, rhs, with_comparator, ChangeScore::EntryCount);
}

} // namespace tree_diff
