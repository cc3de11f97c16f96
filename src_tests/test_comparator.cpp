// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

/**
 * @file test_comparator.cpp
 * @brief Output normalization and pass/fail decisions
 */

#include <catch2/catch_test_macros.hpp>

#include "cortex_grading/comparator.hpp"

#include <limits>

using cortex::grading::ComparisonMode;
using cortex::grading::Value;
using cortex::grading::normalize;
using cortex::grading::outputs_match;
using cortex::grading::round_to_digits;

TEST_CASE("Floats round to six decimal places", "[comparator]")
{
    REQUIRE(round_to_digits(0.1 + 0.2, 6) == 0.3);
    REQUIRE(round_to_digits(2.0000004, 6) == 2.0);
    REQUIRE(round_to_digits(-1e-9, 6) == 0.0);
    REQUIRE(round_to_digits(1234567.123456789, 6) == 1234567.123457);

    const double inf = std::numeric_limits<double>::infinity();
    REQUIRE(round_to_digits(inf, 6) == inf);
}

TEST_CASE("Normalization recurses into sequences and mappings", "[comparator]")
{
    const Value raw = Value::parse(R"({"a": [0.30000000000000004, 1, "x"], "b": {"c": 2.0000001}})");
    const Value expected = Value::parse(R"({"a": [0.3, 1, "x"], "b": {"c": 2.0}})");
    REQUIRE(normalize(raw) == expected);
}

TEST_CASE("Float noise beyond six decimals does not fail a test", "[comparator]")
{
    REQUIRE(outputs_match(Value(0.1 + 0.2), Value(0.3)));
    REQUIRE(outputs_match(Value::parse("[0.30000000000000004, 1.0]"), Value::parse("[0.3, 1]")));
    REQUIRE_FALSE(outputs_match(Value(0.301), Value(0.3)));
}

TEST_CASE("Integers and floats compare numerically", "[comparator]")
{
    REQUIRE(outputs_match(Value(3), Value(3.0)));
    REQUIRE(outputs_match(Value(3.0), Value(3)));
    REQUIRE_FALSE(outputs_match(Value(3), Value(4)));
}

TEST_CASE("Booleans never equal numbers", "[comparator]")
{
    REQUIRE_FALSE(outputs_match(Value(true), Value(1)));
    REQUIRE_FALSE(outputs_match(Value(0), Value(false)));
    REQUIRE(outputs_match(Value(true), Value(true)));
}

TEST_CASE("Null expected requires null actual", "[comparator]")
{
    REQUIRE(outputs_match(Value(nullptr), Value(nullptr)));
    REQUIRE_FALSE(outputs_match(Value(0), Value(nullptr)));
    REQUIRE_FALSE(outputs_match(Value::array(), Value(nullptr)));
    REQUIRE_FALSE(outputs_match(Value(nullptr), Value(0)));
}

TEST_CASE("Sequences need equal lengths", "[comparator]")
{
    REQUIRE_FALSE(outputs_match(Value::parse("[1, 2]"), Value::parse("[1, 2, 3]")));
    REQUIRE_FALSE(outputs_match(Value::parse("[1, 2]"), Value::parse("[1, 2, 3]"),
                                ComparisonMode::Unordered));
}

TEST_CASE("Ordered comparison is order sensitive", "[comparator]")
{
    REQUIRE(outputs_match(Value::parse("[0, 1]"), Value::parse("[0, 1]")));
    REQUIRE_FALSE(outputs_match(Value::parse("[1, 0]"), Value::parse("[0, 1]")));
}

TEST_CASE("Unordered comparison treats top-level sequences as multisets", "[comparator]")
{
    const auto mode = ComparisonMode::Unordered;
    REQUIRE(outputs_match(Value::parse("[[1, 2], [0, 3]]"), Value::parse("[[0, 3], [1, 2]]"), mode));
    REQUIRE(outputs_match(Value::parse("[2, 1.0000000001, 2]"), Value::parse("[1, 2, 2]"), mode));
    // multiplicity matters
    REQUIRE_FALSE(outputs_match(Value::parse("[1, 1, 2]"), Value::parse("[1, 2, 2]"), mode));
    // nested sequences stay ordered
    REQUIRE_FALSE(outputs_match(Value::parse("[[2, 1]]"), Value::parse("[[1, 2]]"), mode));
}

TEST_CASE("Mappings compare by key and normalized value", "[comparator]")
{
    REQUIRE(outputs_match(Value::parse(R"({"x": 1.0000000001, "y": "a"})"),
                          Value::parse(R"({"y": "a", "x": 1})")));
    REQUIRE_FALSE(outputs_match(Value::parse(R"({"x": 1})"), Value::parse(R"({"x": 1, "y": 2})")));
}

TEST_CASE("Strings compare exactly", "[comparator]")
{
    REQUIRE(outputs_match(Value("abc"), Value("abc")));
    REQUIRE_FALSE(outputs_match(Value("abc "), Value("abc")));
    REQUIRE_FALSE(outputs_match(Value("1"), Value(1)));
}

TEST_CASE("Big integers equal only the same big integer", "[comparator]")
{
    const auto big = cortex::grading::make_big_integer("354224848179261915075");
    REQUIRE(outputs_match(big, cortex::grading::make_big_integer("354224848179261915075")));
    REQUIRE_FALSE(outputs_match(big, Value("354224848179261915075")));
    REQUIRE_FALSE(outputs_match(big, Value(3.54224848179261915075e20)));
    REQUIRE_FALSE(outputs_match(big, cortex::grading::make_big_integer("354224848179261915076")));
    REQUIRE(cortex::grading::is_big_integer(big));
    REQUIRE_FALSE(cortex::grading::is_big_integer(Value::parse(R"({"$bigint": 1})")));
}
