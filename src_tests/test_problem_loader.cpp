// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

/**
 * @file test_problem_loader.cpp
 * @brief problem.yaml loading, scalar typing and failure modes
 */

#include <catch2/catch_test_macros.hpp>

#include "cortex_grading/errors.hpp"
#include "cortex_grading/problem_loader.hpp"
#include "scratch_dir.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <string>

using namespace cortex::grading;

using cortex::grading::testing::ScratchDir;

TEST_CASE("Problem directory with a full definition", "[problem_loader]")
{
    ScratchDir dir;
    dir.write("problem.yaml",
              "id: two-sum\n"
              "title: Two Sum\n"
              "description: Pedagogical text that is ignored\n"
              "hints: [one, two]\n"
              "starter_code_python: |\n"
              "  def two_sum(nums, target):\n"
              "      pass\n"
              "test_cases:\n"
              "  - id: basic\n"
              "    input: {nums: [2, 7, 11, 15], target: 9}\n"
              "    expected: [0, 1]\n"
              "    explanation: 2 + 7 = 9\n"
              "  - input: {nums: [3, 3], target: 6}\n"
              "    expected: [0, 1]\n");

    const auto spec = ProblemLoader{}.load(dir.path());
    REQUIRE(spec.id == "two-sum");
    REQUIRE(spec.title == "Two Sum");
    REQUIRE(spec.comparison == ComparisonMode::Ordered);
    REQUIRE(spec.entry_point_hint.has_value());
    REQUIRE(spec.entry_point_hint->find("def two_sum(nums, target):") != std::string::npos);

    REQUIRE(spec.test_cases.size() == 2);
    const auto& first = spec.test_cases[0];
    REQUIRE(first.id == "basic");
    REQUIRE(first.input == Value::parse(R"({"nums": [2, 7, 11, 15], "target": 9})"));
    REQUIRE(first.expected == Value::parse("[0, 1]"));
    REQUIRE(first.explanation == "2 + 7 = 9");
    REQUIRE_FALSE(first.comparison.has_value());

    const auto& second = spec.test_cases[1];
    REQUIRE(second.id == "unknown");
    REQUIRE(second.explanation.empty());
}

TEST_CASE("A regular file path is loaded as is", "[problem_loader]")
{
    ScratchDir dir;
    dir.write("custom.yaml", "test_cases:\n  - id: t\n    input: {}\n    expected: 1\n");

    const auto spec = ProblemLoader{}.load(dir.path() / "custom.yaml");
    REQUIRE(spec.test_cases.size() == 1);
    REQUIRE(spec.test_cases[0].input == Value::object());
}

TEST_CASE("Scalars follow the YAML core schema", "[problem_loader]")
{
    ScratchDir dir;
    dir.write("problem.yaml",
              "test_cases:\n"
              "  - id: 7\n"
              "    input:\n"
              "      i: 42\n"
              "      neg: -17\n"
              "      hex: 0x1F\n"
              "      f: 2.5\n"
              "      e: 1e3\n"
              "      inf: -.inf\n"
              "      yes: true\n"
              "      no: False\n"
              "      nothing: ~\n"
              "      empty:\n"
              "      word: hello\n"
              "      quoted: \"42\"\n"
              "      single: 'true'\n"
              "      big: 18446744073709551615\n"
              "    expected: null\n");

    const auto spec = ProblemLoader{}.load(dir.path());
    const auto& test_case = spec.test_cases.at(0);
    const auto& input = test_case.input;

    REQUIRE(test_case.id == "7");
    REQUIRE(input["i"].is_number_integer());
    REQUIRE(input["i"] == 42);
    REQUIRE(input["neg"] == -17);
    REQUIRE(input["hex"] == 31);
    REQUIRE(input["f"].is_number_float());
    REQUIRE(input["f"] == 2.5);
    REQUIRE(input["e"] == 1000.0);
    REQUIRE(std::isinf(input["inf"].get<double>()));
    REQUIRE(input["inf"].get<double>() < 0);
    REQUIRE(input["yes"] == true);
    REQUIRE(input["no"] == false);
    REQUIRE(input["nothing"].is_null());
    REQUIRE(input["empty"].is_null());
    REQUIRE(input["word"] == "hello");
    REQUIRE(input["quoted"] == "42");
    REQUIRE(input["single"] == "true");
    REQUIRE(input["big"].is_number_unsigned());
    REQUIRE(input["big"].get<std::uint64_t>() == 18446744073709551615ULL);
    REQUIRE(test_case.expected.is_null());
}

TEST_CASE("Integers beyond 64 bits stay exact", "[problem_loader]")
{
    ScratchDir dir;
    dir.write("problem.yaml",
              "test_cases:\n"
              "  - input:\n"
              "      fib: 354224848179261915075\n"
              "      padded: +000354224848179261915075\n"
              "      negative: -9223372036854775809\n"
              "      min: -9223372036854775808\n"
              "      hex: 0x10000000000000000\n"
              "      quoted: \"354224848179261915075\"\n"
              "    expected: 1\n");

    const auto spec = ProblemLoader{}.load(dir.path());
    const auto& input = spec.test_cases.at(0).input;
    REQUIRE(input["fib"] == make_big_integer("354224848179261915075"));
    REQUIRE(is_big_integer(input["fib"]));
    REQUIRE(input["padded"] == make_big_integer("354224848179261915075"));
    REQUIRE(input["negative"] == make_big_integer("-9223372036854775809"));
    REQUIRE(input["min"].is_number_integer());
    REQUIRE(input["hex"] == make_big_integer("18446744073709551616"));
    REQUIRE(input["quoted"] == "354224848179261915075");
}

TEST_CASE("Comparison mode at problem and test case level", "[problem_loader]")
{
    ScratchDir dir;
    dir.write("problem.yaml",
              "comparison: unordered\n"
              "test_cases:\n"
              "  - id: a\n"
              "    input: {}\n"
              "    expected: []\n"
              "  - id: b\n"
              "    input: {}\n"
              "    expected: []\n"
              "    comparison: Ordered\n");

    const auto spec = ProblemLoader{}.load(dir.path());
    REQUIRE(spec.comparison == ComparisonMode::Unordered);
    REQUIRE_FALSE(spec.test_cases[0].comparison.has_value());
    REQUIRE(spec.test_cases[1].comparison == ComparisonMode::Ordered);
}

TEST_CASE("Unknown comparison mode is a parse error", "[problem_loader]")
{
    ScratchDir dir;
    dir.write("problem.yaml", "comparison: fuzzy\ntest_cases:\n  - {input: {}, expected: 1}\n");
    REQUIRE_THROWS_AS(ProblemLoader{}.load(dir.path()), ParseError);
}

TEST_CASE("Missing definition file", "[problem_loader]")
{
    ScratchDir dir;
    try {
        (void)ProblemLoader{}.load(dir.path());
        FAIL("expected NotFoundError");
    } catch (const NotFoundError& ex) {
        const auto expected = "Problem file not found: " + (dir.path() / "problem.yaml").string();
        REQUIRE(std::string{ex.what()} == expected);
    }
}

TEST_CASE("Definitions without test cases", "[problem_loader]")
{
    ScratchDir dir;

    SECTION("empty sequence")
    {
        dir.write("problem.yaml", "id: x\ntest_cases: []\n");
    }
    SECTION("key absent")
    {
        dir.write("problem.yaml", "id: x\ntitle: nothing to run\n");
    }
    SECTION("empty document")
    {
        dir.write("problem.yaml", "");
    }

    try {
        (void)ProblemLoader{}.load(dir.path());
        FAIL("expected NoTestCasesError");
    } catch (const NoTestCasesError& ex) {
        REQUIRE(std::string{ex.what()} == "No test cases found in problem definition");
    }
}

TEST_CASE("Malformed definitions are parse errors", "[problem_loader]")
{
    ScratchDir dir;

    SECTION("invalid YAML")
    {
        dir.write("problem.yaml", "test_cases: [\n  - id: a\n");
    }
    SECTION("root is a sequence")
    {
        dir.write("problem.yaml", "- a\n- b\n");
    }
    SECTION("test_cases is a mapping")
    {
        dir.write("problem.yaml", "test_cases:\n  a: 1\n");
    }
    SECTION("test case is a scalar")
    {
        dir.write("problem.yaml", "test_cases:\n  - just text\n");
    }

    REQUIRE_THROWS_AS(ProblemLoader{}.load(dir.path()), ParseError);
}

TEST_CASE("Comparison mode names", "[problem_loader]")
{
    REQUIRE(parse_comparison_mode("ordered") == ComparisonMode::Ordered);
    REQUIRE(parse_comparison_mode("UNORDERED") == ComparisonMode::Unordered);
    REQUIRE_FALSE(parse_comparison_mode("sorted").has_value());
    REQUIRE(to_string(ComparisonMode::Unordered) == "unordered");
}
