// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// lcs.cpp - Similarity-based subsequence matching

#include <tree_diff/lcs.h>
#include <tree_diff/value_compare.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

namespace tree_diff {

double map_similarity(const DiffPath& path, const ValueMap& lhs, const ValueMap& rhs,
                      const DiffOptions& options)
{
    std::set<std::string> keys;
    for (const auto& [key, box] : lhs) keys.insert(key);
    for (const auto& [key, box] : rhs) keys.insert(key);

    if (keys.empty()) {
        return 1.0;
    }

    std::size_t equal = 0;
    for (const auto& key : keys) {
        const auto* l = lhs.find(key);
        const auto* r = rhs.find(key);
        const DiffPath key_path = append_key(path, key, options);
        const bool same = (l && r) ? values_equal(key_path, l->get(), r->get(), options)
                                   : one_sided_key_equal(key_path, l ? l->get() : Value{},
                                                         r ? r->get() : Value{}, options);
        if (same) {
            ++equal;
        }
    }
    return static_cast<double>(equal) / static_cast<double>(keys.size());
}

bool similar(const DiffPath& path, const Value& lhs, const Value& rhs, const DiffOptions& options)
{
    if (values_equal(path, lhs, rhs, options)) {
        return true;
    }
    const auto* lm = lhs.get_if<ValueMap>();
    const auto* rm = rhs.get_if<ValueMap>();
    if (lm && rm) {
        return map_similarity(path, *lm, *rm, options) >= options.similarity;
    }
    return false;
}

namespace {

// Alignment quality: matched pairs first, then gaps whose first removal and
// first addition are both scalars (they fold into one Modify).
struct Score {
    std::ptrdiff_t matched = -1; // -1: unreachable
    std::ptrdiff_t folded = 0;

    bool reachable() const { return matched >= 0; }
    bool operator<(const Score& other) const
    {
        return matched != other.matched ? matched < other.matched : folded < other.folded;
    }
};

Score advance(const Score& from, std::ptrdiff_t matched, std::ptrdiff_t folded)
{
    if (!from.reachable()) {
        return from;
    }
    return Score{from.matched + matched, from.folded + folded};
}

} // anonymous namespace

std::vector<IndexPair> match_subsequence(const ValueVector& a, const ValueVector& b,
                                         const DiffPath& prefix, const DiffOptions& options)
{
    if (a.size() == 0 || b.size() == 0) {
        return {};
    }

    // Cell (i, j) describes alignments of a[0, i) with b[0, j), ending either
    // right after a matched pair or inside a run of unmatched elements.
    enum class State : uint8_t { Boundary, Gap };
    enum class Step : uint8_t { Remove, Add, Replace };
    struct Cell {
        Score boundary;
        Score gap;
        State boundary_from = State::Boundary;
        State gap_from = State::Boundary;
        Step gap_step = Step::Remove;

        const Score& best() const { return boundary < gap ? gap : boundary; }
        State best_state() const { return boundary < gap ? State::Gap : State::Boundary; }
    };

    const std::size_t n = a.size();
    const std::size_t m = b.size();
    const std::size_t stride = m + 1;
    std::vector<Cell> table((n + 1) * stride);
    auto cell = [&](std::size_t i, std::size_t j) -> Cell& { return table[i * stride + j]; };

    // Element paths depend only on the index in a
    std::vector<DiffPath> paths;
    paths.reserve(n);
    for (std::size_t ai = 0; ai < n; ++ai) {
        paths.push_back(append_index(prefix, ai, options));
    }

    cell(0, 0).boundary = Score{0, 0};

    for (std::size_t i = 0; i <= n; ++i) {
        for (std::size_t j = 0; j <= m; ++j) {
            if (i == 0 && j == 0) {
                continue;
            }
            Cell& current = cell(i, j);

            auto consider = [&](const Score& candidate, Step step, State from) {
                if (current.gap < candidate) {
                    current.gap = candidate;
                    current.gap_step = step;
                    current.gap_from = from;
                }
            };

            if (i > 0) {
                const Cell& up = cell(i - 1, j);
                consider(up.best(), Step::Remove, up.best_state());
            }
            if (j > 0) {
                const Cell& left = cell(i, j - 1);
                consider(left.best(), Step::Add, left.best_state());
            }
            if (i > 0 && j > 0) {
                const Cell& diagonal = cell(i - 1, j - 1);
                const Value& x = a[i - 1].get();
                const Value& y = b[j - 1].get();
                if (similar(paths[i - 1], x, y, options)) {
                    current.boundary = advance(diagonal.best(), 1, 0);
                    current.boundary_from = diagonal.best_state();
                }
                if (!x.is_container() && !y.is_container()) {
                    consider(advance(diagonal.boundary, 0, 1), Step::Replace, State::Boundary);
                }
            }
        }
    }

    std::vector<IndexPair> pairs;
    std::size_t i = n;
    std::size_t j = m;
    State state = cell(n, m).best_state();
    while (i > 0 || j > 0) {
        const Cell& current = cell(i, j);
        if (state == State::Boundary) {
            pairs.emplace_back(i - 1, j - 1);
            state = current.boundary_from;
            --i;
            --j;
            continue;
        }
        state = current.gap_from;
        switch (current.gap_step) {
            case Step::Remove:
                --i;
                break;
            case Step::Add:
                --j;
                break;
            case Step::Replace:
                --i;
                --j;
                break;
        }
    }

    std::reverse(pairs.begin(), pairs.end());
    return pairs;
}

} // namespace tree_diff
