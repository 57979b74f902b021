// test_lcs.cpp - Tests for similarity and subsequence matching

#include <catch2/catch_all.hpp>
#include <tree_diff/lcs.h>

#include <initializer_list>
#include <vector>

using namespace tree_diff;

namespace {

ValueVector ints(std::initializer_list<int> values) {
    auto t = ValueVector{}.transient();
    for (int v : values) {
        t.push_back(ValueBox{Value{v}});
    }
    return t.persistent();
}

} // namespace

// ============================================================
// Similarity
// ============================================================

TEST_CASE("map_similarity", "[lcs][similarity]") {
    DiffOptions opts;
    const DiffPath root = root_path(opts);

    SECTION("fraction of keys equal on both sides") {
        auto a = Value::map({{"a", Value{1}}, {"b", Value{2}}});
        auto b = Value::map({{"a", Value{1}}, {"b", Value{3}}});
        REQUIRE(map_similarity(root, a.as_map(), b.as_map(), opts) == 0.5);
    }

    SECTION("keys on one side only count against") {
        auto a = Value::map({{"a", Value{1}}, {"c", Value{3}}, {"e", Value{5}}});
        auto b = Value::map({{"a", Value{1}}, {"b", Value{2}}, {"e", Value{5}}});
        REQUIRE(map_similarity(root, a.as_map(), b.as_map(), opts) == 0.5);
    }

    SECTION("two empty maps are fully similar") {
        REQUIRE(map_similarity(root, ValueMap{}, ValueMap{}, opts) == 1.0);
    }

    SECTION("disjoint maps") {
        auto a = Value::map({{"y", Value{3}}});
        auto b = Value::map({{"a", Value{1}}});
        REQUIRE(map_similarity(root, a.as_map(), b.as_map(), opts) == 0.0);
    }
}

TEST_CASE("map_similarity asks the comparator about one-sided keys", "[lcs][similarity][comparator]") {
    DiffOptions opts;
    opts.comparator = [](const DiffPath& path, const Value&, const Value&) {
        return path_to_string(path) == "ts" ? Verdict::equal() : Verdict::defer();
    };
    const DiffPath root = root_path(opts);

    auto a = Value::map({{"id", Value{1}}, {"ts", Value{5}}});
    auto b = Value::map({{"id", Value{1}}});
    REQUIRE(map_similarity(root, a.as_map(), b.as_map(), opts) == 1.0);
    REQUIRE(map_similarity(root, b.as_map(), a.as_map(), opts) == 1.0);

    auto c = Value::map({{"id", Value{1}}, {"other", Value{5}}});
    REQUIRE(map_similarity(root, c.as_map(), b.as_map(), opts) == 0.5);
}

TEST_CASE("similar", "[lcs][similarity]") {
    DiffOptions opts;
    const DiffPath root = root_path(opts);

    auto base = Value::map({
        {"a", Value{1}}, {"b", Value{2}}, {"c", Value{3}}, {"d", Value{4}}, {"e", Value{5}},
    });
    auto one_off = Value::map({
        {"a", Value{1}}, {"b", Value{2}}, {"c", Value{3}}, {"d", Value{4}}, {"e", Value{6}},
    });

    SECTION("threshold is inclusive") {
        REQUIRE(similar(root, base, one_off, opts));
        REQUIRE_FALSE(similar(root, base, one_off, opts.with_similarity(0.9)));
    }

    SECTION("scalars must be equal") {
        REQUIRE(similar(root, Value{1}, Value{1}, opts));
        REQUIRE_FALSE(similar(root, Value{1}, Value{2}, opts));
    }

    SECTION("sequences must be equal") {
        auto a = Value::vector({Value{1}, Value{2}, Value{3}, Value{4}, Value{5}});
        auto b = Value::vector({Value{1}, Value{2}, Value{3}, Value{4}, Value{6}});
        REQUIRE_FALSE(similar(root, a, b, opts.with_similarity(0.1)));
    }
}

// ============================================================
// Subsequence matching
// ============================================================

TEST_CASE("match_subsequence", "[lcs][match]") {
    DiffOptions opts;
    const DiffPath root = root_path(opts);

    SECTION("common prefix and suffix") {
        auto pairs = match_subsequence(ints({1, 2, 3}), ints({1, 2, 3, 4}), root, opts);
        REQUIRE(pairs == std::vector<IndexPair>{{0, 0}, {1, 1}, {2, 2}});
    }

    SECTION("shifted elements") {
        auto pairs = match_subsequence(ints({1, 2, 3}), ints({2, 3, 4}), root, opts);
        REQUIRE(pairs == std::vector<IndexPair>{{1, 0}, {2, 1}});
    }

    SECTION("nothing in common") {
        REQUIRE(match_subsequence(ints({1, 2}), ints({3, 4}), root, opts).empty());
    }

    SECTION("empty input") {
        REQUIRE(match_subsequence(ValueVector{}, ints({1}), root, opts).empty());
        REQUIRE(match_subsequence(ints({1}), ValueVector{}, root, opts).empty());
    }

    SECTION("pairs are strictly increasing on both sides") {
        auto pairs = match_subsequence(ints({5, 1, 5, 2, 5, 3}), ints({1, 2, 9, 3, 5}), root, opts);
        REQUIRE(pairs.size() == 3);
        for (std::size_t i = 1; i < pairs.size(); ++i) {
            REQUIRE(pairs[i].first > pairs[i - 1].first);
            REQUIRE(pairs[i].second > pairs[i - 1].second);
        }
    }

    SECTION("prefers runs that start with two scalars") {
        // Both ways: match 2 and 1, leaving a run that begins 0 against 2
        auto forward = match_subsequence(ints({2, 0, 1}), ints({2, 2, 2, 1}), root, opts);
        REQUIRE(forward.size() == 2);
        REQUIRE(forward.front().second < 2);
        REQUIRE(forward.back() == IndexPair{2, 3});

        auto backward = match_subsequence(ints({2, 2, 2, 1}), ints({2, 0, 1}), root, opts);
        REQUIRE(backward.size() == 2);
        REQUIRE(backward.front().first < 2);
        REQUIRE(backward.back() == IndexPair{3, 2});
    }

    SECTION("similar maps are aligned") {
        auto a = Value::vector({
            Value::map({{"a", Value{1}}, {"c", Value{3}}, {"e", Value{5}}}),
            Value::map({{"y", Value{3}}}),
        });
        auto b = Value::vector({
            Value::map({{"a", Value{1}}, {"b", Value{2}}, {"e", Value{5}}}),
        });

        auto loose = match_subsequence(a.as_vector(), b.as_vector(), root, opts.with_similarity(0.5));
        REQUIRE(loose == std::vector<IndexPair>{{0, 0}});

        auto tight = match_subsequence(a.as_vector(), b.as_vector(), root, opts.with_similarity(0.8));
        REQUIRE(tight.empty());
    }
}
