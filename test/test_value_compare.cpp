// test_value_compare.cpp - Tests for option-aware equality

#include <catch2/catch_all.hpp>
#include <tree_diff/errors.h>
#include <tree_diff/options.h>
#include <tree_diff/value_compare.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace tree_diff;

TEST_CASE("comparable", "[compare][types]") {
    SECTION("containers of the same kind") {
        REQUIRE(comparable(Value::map({}), Value::map({{"a", Value{1}}}), true));
        REQUIRE(comparable(Value::vector({}), Value::vector({Value{1}}), true));
        REQUIRE_FALSE(comparable(Value::map({}), Value::vector({}), false));
    }

    SECTION("numbers across representations only when not strict") {
        REQUIRE_FALSE(comparable(Value{1}, Value{1.0}, true));
        REQUIRE(comparable(Value{1}, Value{1.0}, false));
    }

    SECTION("scalars of different types") {
        REQUIRE_FALSE(comparable(Value{"1"}, Value{1}, false));
        REQUIRE_FALSE(comparable(Value{true}, Value{1}, false));
        REQUIRE(comparable(Value{}, Value{}, true));
    }
}

TEST_CASE("compare_values numeric tolerance", "[compare][numeric]") {
    DiffOptions opts;

    SECTION("exact by default") {
        REQUIRE(compare_values(Value{1.0}, Value{1.0}, opts));
        REQUIRE_FALSE(compare_values(Value{1.0}, Value{1.5}, opts));
        REQUIRE(compare_values(Value{7}, Value{7}, opts));
        REQUIRE_FALSE(compare_values(Value{7}, Value{8}, opts));
    }

    SECTION("boundary is inclusive") {
        opts.numeric_tolerance = 0.5;
        REQUIRE(compare_values(Value{1.0}, Value{1.5}, opts));
        REQUIRE(compare_values(Value{1.0}, Value{0.5}, opts));
        REQUIRE_FALSE(compare_values(Value{1.0}, Value{1.75}, opts));
    }

    SECTION("integers compare through the tolerance too") {
        opts.numeric_tolerance = 1.0;
        REQUIRE(compare_values(Value{10}, Value{11}, opts));
        REQUIRE_FALSE(compare_values(Value{10}, Value{12}, opts));
    }

    SECTION("mixed representations") {
        REQUIRE(compare_values(Value{2}, Value{2.0}, opts));
    }
}

TEST_CASE("compare_values string stripping", "[compare][strip]") {
    DiffOptions opts;

    REQUIRE_FALSE(compare_values(Value{"  a b\t\n"}, Value{"a b"}, opts));

    opts.strip = true;
    REQUIRE(compare_values(Value{"  a b\t\n"}, Value{"a b"}, opts));
    REQUIRE_FALSE(compare_values(Value{"a  b"}, Value{"a b"}, opts));

    SECTION("trim helper") {
        REQUIRE(detail::trim("  x ") == "x");
        REQUIRE(detail::trim(" \r\n").empty());
        REQUIRE(detail::trim(std::string_view{"\0x\0", 3}) == "x");
    }
}

TEST_CASE("values_equal deep comparison", "[compare][deep]") {
    DiffOptions opts;
    const DiffPath root = root_path(opts);

    auto a = Value::map({
        {"list", Value::vector({Value{1}, Value::map({{"k", Value{"v"}}})})},
        {"n", Value{}},
    });

    SECTION("identical structures") {
        REQUIRE(values_equal(root, a, a, opts));
    }

    SECTION("a nested difference") {
        auto b = Value::map({
            {"list", Value::vector({Value{1}, Value::map({{"k", Value{"w"}}})})},
            {"n", Value{}},
        });
        REQUIRE_FALSE(values_equal(root, a, b, opts));
    }

    SECTION("differing sizes") {
        REQUIRE_FALSE(values_equal(root, Value::vector({Value{1}}), Value::vector({Value{1}, Value{2}}), opts));
        REQUIRE_FALSE(values_equal(root, Value::map({{"a", Value{1}}}), Value::map({}), opts));
    }

    SECTION("null against a value") {
        REQUIRE_FALSE(values_equal(root, Value{}, Value{0}, opts));
    }

    SECTION("options apply below the top level") {
        opts.numeric_tolerance = 0.5;
        REQUIRE(values_equal(root,
                             Value::vector({Value{1.0}}),
                             Value::vector({Value{1.25}}), opts));
    }
}

TEST_CASE("values_equal consults the comparator with element paths", "[compare][comparator]") {
    DiffOptions opts;
    std::vector<std::string> seen;
    opts.comparator = [&seen](const DiffPath& path, const Value&, const Value&) {
        seen.push_back(path_to_string(path));
        if (path_to_string(path) == "a[1]") {
            return Verdict::equal();
        }
        return Verdict::defer();
    };

    auto lhs = Value::map({{"a", Value::vector({Value{1}, Value{2}})}});
    auto rhs = Value::map({{"a", Value::vector({Value{1}, Value{99}})}});

    REQUIRE(values_equal(root_path(opts), lhs, rhs, opts));
    REQUIRE(std::find(seen.begin(), seen.end(), "a[1]") != seen.end());
}

TEST_CASE("values_equal asks the comparator about one-sided keys", "[compare][comparator]") {
    DiffOptions opts;
    std::vector<std::string> seen;
    opts.comparator = [&seen](const DiffPath& path, const Value& l, const Value& r) {
        const auto p = path_to_string(path);
        if (l.is_null() || r.is_null()) seen.push_back(p);
        return p.size() >= 3 && p.compare(p.size() - 3, 3, ".ts") == 0 ? Verdict::equal()
                                                                       : Verdict::defer();
    };
    const DiffPath root = root_path(opts);

    auto with_ts = Value::map({{"row", Value::map({{"id", Value{1}}, {"ts", Value{5}}})}});
    auto without_ts = Value::map({{"row", Value::map({{"id", Value{1}}})}});

    REQUIRE(values_equal(root, with_ts, without_ts, opts));
    REQUIRE(values_equal(root, without_ts, with_ts, opts));
    REQUIRE(std::count(seen.begin(), seen.end(), "row.ts") == 2);

    SECTION("keys the comparator does not accept still differ") {
        auto with_extra = Value::map({{"row", Value::map({{"id", Value{1}}, {"extra", Value{5}}})}});
        REQUIRE_FALSE(values_equal(root, with_extra, without_ts, opts));
        REQUIRE_FALSE(values_equal(root, without_ts, with_extra, opts));
    }

    SECTION("without a comparator a null value is not a missing key") {
        DiffOptions plain;
        REQUIRE_FALSE(values_equal(root_path(plain), Value::map({{"a", Value{}}}), Value::map({}), plain));
    }
}

TEST_CASE("DiffOptions validation", "[compare][options]") {
    DiffOptions opts;
    REQUIRE_NOTHROW(opts.validate());

    SECTION("similarity must be in (0, 1]") {
        opts.similarity = 0.0;
        REQUIRE_THROWS_AS(opts.validate(), invalid_options_error);
        opts.similarity = 1.5;
        REQUIRE_THROWS_AS(opts.validate(), invalid_options_error);
        opts.similarity = 1.0;
        REQUIRE_NOTHROW(opts.validate());
    }

    SECTION("tolerance must be non-negative") {
        opts.numeric_tolerance = -0.1;
        REQUIRE_THROWS_AS(opts.validate(), invalid_options_error);
        opts.numeric_tolerance = std::nan("");
        REQUIRE_THROWS_AS(opts.validate(), invalid_options_error);
    }

    SECTION("max_depth must be positive") {
        opts.max_depth = 0;
        REQUIRE_THROWS_AS(opts.validate(), invalid_options_error);
    }

    SECTION("with_similarity copies everything else") {
        opts.strip = true;
        auto copy = opts.with_similarity(0.3);
        REQUIRE(copy.similarity == 0.3);
        REQUIRE(copy.strip);
        REQUIRE(opts.similarity == 0.8);
    }
}

TEST_CASE("consult_comparator without a comparator defers", "[compare][comparator]") {
    DiffOptions opts;
    REQUIRE(consult_comparator(root_path(opts), Value{1}, Value{2}, opts).is_defer());
}
