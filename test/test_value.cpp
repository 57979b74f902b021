// test_value.cpp - Tests for Value and JSON serialization

#include <catch2/catch_all.hpp>
#include <tree_diff/serialization.h>
#include <tree_diff/value.h>

#include <cmath>
#include <limits>
#include <string>

using namespace tree_diff;

// ============================================================
// Construction and access
// ============================================================

TEST_CASE("Value default construction", "[value][construction]") {
    Value v;
    REQUIRE(v.is_null());
    REQUIRE(v.size() == 0);
}

TEST_CASE("Value scalar construction", "[value][construction]") {
    SECTION("int is stored as int64") {
        Value v{42};
        REQUIRE(v.is_integer());
        REQUIRE(v.as_int64() == 42);
    }

    SECTION("double") {
        Value v{2.5};
        REQUIRE(v.is<double>());
        REQUIRE_FALSE(v.is_integer());
        REQUIRE(v.as_double() == 2.5);
    }

    SECTION("number view covers both representations") {
        REQUIRE(Value{3}.as_number() == 3.0);
        REQUIRE(Value{3.5}.as_number() == 3.5);
        REQUIRE(Value{"3"}.as_number(-1.0) == -1.0);
    }

    SECTION("bool") {
        REQUIRE(Value{true}.as_bool());
        REQUIRE_FALSE(Value{true}.is_number());
    }

    SECTION("string") {
        Value v{"hello"};
        REQUIRE(v.is_string());
        REQUIRE(v.as_string() == "hello");
    }
}

TEST_CASE("Value container construction", "[value][construction]") {
    auto doc = Value::map({
        {"name", Value{"Alice"}},
        {"tags", Value::vector({Value{"a"}, Value{"b"}})},
    });

    REQUIRE(doc.is_map());
    REQUIRE(doc.is_container());
    REQUIRE(doc.size() == 2);
    REQUIRE(doc.contains("name"));
    REQUIRE_FALSE(doc.contains("missing"));
    REQUIRE(doc.at("name").as_string() == "Alice");
    REQUIRE(doc.at("tags").at(1).as_string() == "b");

    SECTION("missing key and index yield null") {
        REQUIRE(doc.at("missing").is_null());
        REQUIRE(doc.at("tags").at(5).is_null());
        REQUIRE(Value{1}.at("x").is_null());
    }
}

TEST_CASE("Value structural equality", "[value][equality]") {
    REQUIRE(Value::map({{"a", Value{1}}}) == Value::map({{"a", Value{1}}}));
    REQUIRE(Value::map({{"a", Value{1}}}) != Value::map({{"a", Value{2}}}));
    REQUIRE(Value::vector({Value{1}, Value{2}}) != Value::vector({Value{2}, Value{1}}));

    // int64 and double are distinct scalar types
    REQUIRE(Value{1} != Value{1.0});
}

// ============================================================
// JSON
// ============================================================

TEST_CASE("to_json writes map keys in sorted order", "[value][json]") {
    auto doc = Value::map({
        {"zeta", Value{1}},
        {"alpha", Value{2}},
        {"mid", Value::vector({Value{true}, Value{}})},
    });

    REQUIRE(to_json(doc, true) == R"({"alpha":2,"mid":[true,null],"zeta":1})");
}

TEST_CASE("to_json pretty output", "[value][json]") {
    auto doc = Value::map({{"a", Value::vector({Value{1}})}});
    REQUIRE(to_json(doc) == "{\n  \"a\": [\n    1\n  ]\n}");
    REQUIRE(to_json(Value::map({})) == "{}");
    REQUIRE(to_json(Value::vector({})) == "[]");
}

TEST_CASE("to_json number formatting", "[value][json]") {
    SECTION("integral doubles keep a fractional part") {
        REQUIRE(to_json(Value{1.0}, true) == "1.0");
        REQUIRE(to_json(Value{2.5}, true) == "2.5");
    }

    SECTION("integers") {
        REQUIRE(to_json(Value{-7}, true) == "-7");
    }

    SECTION("doubles read back unchanged") {
        const double sum = 0.1 + 0.2;
        REQUIRE(to_json(Value{sum}, true) == "0.30000000000000004");
        REQUIRE(to_json(Value{0.3}, true) == "0.3");
        REQUIRE(from_json(to_json(Value{sum}, true)).as_double() == sum);
        REQUIRE(from_json(to_json(Value{1e300 / 3}, true)).as_double() == 1e300 / 3);
    }

    SECTION("non-finite doubles become null") {
        REQUIRE(to_json(Value{std::numeric_limits<double>::infinity()}, true) == "null");
        REQUIRE(to_json(Value{std::nan("")}, true) == "null");
    }
}

TEST_CASE("to_json escapes strings", "[value][json]") {
    REQUIRE(to_json(Value{"a\"b\\c\n"}, true) == R"("a\"b\\c\n")");
    REQUIRE(to_json(Value{std::string("\x01", 1)}, true) == R"("\u0001")");
}

TEST_CASE("from_json parses documents", "[value][json]") {
    std::string error;
    auto doc = from_json(R"({"a": 1, "b": [1.5, "x", true, null], "c": {}})", &error);

    REQUIRE(error.empty());
    REQUIRE(doc.at("a").is_integer());
    REQUIRE(doc.at("a").as_int64() == 1);
    REQUIRE(doc.at("b").at(0).as_double() == 1.5);
    REQUIRE(doc.at("b").at(1).as_string() == "x");
    REQUIRE(doc.at("b").at(2).as_bool());
    REQUIRE(doc.at("b").at(3).is_null());
    REQUIRE(doc.at("c").is_map());
    REQUIRE(doc.at("c").size() == 0);
}

TEST_CASE("from_json keeps number representations", "[value][json]") {
    REQUIRE(from_json("10").is_integer());
    REQUIRE(from_json("10.0").is<double>());
    REQUIRE(from_json("1e2").is<double>());
}

TEST_CASE("from_json decodes unicode escapes", "[value][json]") {
    REQUIRE(from_json("\"\\u00e9\"").as_string() == "\xC3\xA9");
}

TEST_CASE("from_json reports malformed input", "[value][json]") {
    std::string error;

    SECTION("empty input") {
        REQUIRE(from_json("", &error).is_null());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("unterminated object") {
        REQUIRE(from_json(R"({"a": 1)", &error).is_null());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("trailing characters") {
        REQUIRE(from_json("[1] x", &error).is_null());
        REQUIRE(error.find("trailing") != std::string::npos);
    }

    SECTION("malformed unicode escapes") {
        REQUIRE(from_json(R"("\u12G4")", &error).is_null());
        REQUIRE(error.find("hex digit") != std::string::npos);
        REQUIRE(from_json(R"("\u-001")", &error).is_null());
        REQUIRE(from_json(R"("\u00")", &error).is_null());
        REQUIRE(from_json(R"("\ud800x")", &error).is_null());
    }

    SECTION("numbers outside the JSON grammar") {
        REQUIRE(from_json("01", &error).is_null());
        REQUIRE(from_json("1.", &error).is_null());
        REQUIRE(from_json("-", &error).is_null());
        REQUIRE(from_json("1e", &error).is_null());
    }

    SECTION("raw control characters in strings") {
        REQUIRE(from_json(std::string("\"a\nb\""), &error).is_null());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("error output is optional") {
        REQUIRE(from_json("{").is_null());
    }
}

TEST_CASE("from_json bounds nesting depth", "[value][json]") {
    auto nested = [](std::size_t depth) {
        return std::string(depth, '[') + std::string(depth, ']');
    };
    std::string error;

    auto deepest = from_json(nested(TREE_DIFF_DEFAULT_MAX_DEPTH), &error);
    REQUIRE(error.empty());
    REQUIRE(deepest.is_vector());

    REQUIRE(from_json(nested(TREE_DIFF_DEFAULT_MAX_DEPTH + 1), &error).is_null());
    REQUIRE(error.find("nesting deeper than") != std::string::npos);
}

TEST_CASE("from_json combines surrogate pairs", "[value][json]") {
    REQUIRE(from_json(R"("\ud83d\ude00")").as_string() == "\xF0\x9F\x98\x80");
}

TEST_CASE("from_json keeps out-of-range integers as doubles", "[value][json]") {
    REQUIRE(from_json("9223372036854775807").is_integer());
    REQUIRE(from_json("9223372036854775808").is<double>());
}

TEST_CASE("JSON text survives a parse and print cycle", "[value][json]") {
    const std::string text = R"({"a":[1,2.5,"s"],"b":{"c":null,"d":false}})";
    REQUIRE(to_json(from_json(text), true) == text);
}
