// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

/**
 * @file test_entry_point.cpp
 * @brief Entry point discovery over a candidate's top-level symbols
 */

#include <catch2/catch_test_macros.hpp>

#include "cortex_grading/entry_point.hpp"
#include "cortex_grading/errors.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace cortex::grading;

namespace {

class NullInvocable final : public Invocable {
public:
    [[nodiscard]] Value invoke(const Value&) const override { return Value{}; }
};

Symbol function(std::string name, bool builtin = false)
{
    return Symbol{std::move(name), true, builtin, std::make_shared<NullInvocable>()};
}

Symbol data(std::string name)
{
    return Symbol{std::move(name), false, false, nullptr};
}

const std::vector<std::string> kFallbacks = EntryPointResolver::Config{}.fallback_names;

} // namespace

TEST_CASE("def lines of the starter code are collected in order", "[entry_point]")
{
    const auto names = hinted_function_names(
        "import math\n"
        "\n"
        "def helper(x):\n"
        "    return x\n"
        "    def nested(y):\n"
        "        pass\n"
        "def   two_sum (nums, target):\n"
        "    pass\n");
    REQUIRE(names == std::vector<std::string>{"helper", "nested", "two_sum"});
    REQUIRE(hinted_function_names("").empty());
    REQUIRE(hinted_function_names("class A:\n    pass\n").empty());
}

TEST_CASE("Starter code hint wins over everything else", "[entry_point]")
{
    const std::vector<Symbol> symbols{function("solve"), function("two_sum")};
    REQUIRE(select_entry_point("def two_sum(nums, target):\n    pass\n", symbols, kFallbacks) ==
            "two_sum");
}

TEST_CASE("Hinted name that is not defined falls through", "[entry_point]")
{
    const std::vector<Symbol> symbols{function("helper"), function("solution")};
    REQUIRE(select_entry_point("def missing():\n    pass\n", symbols, kFallbacks) == "solution");
}

TEST_CASE("Fallback names are tried in list order", "[entry_point]")
{
    const std::vector<Symbol> symbols{function("main"), function("solve")};
    REQUIRE(select_entry_point("", symbols, kFallbacks) == "solve");

    const std::vector<Symbol> only_pairs{function("find_top_k_pairs"), function("find_asteroid_pair")};
    REQUIRE(select_entry_point("", only_pairs, kFallbacks) == "find_asteroid_pair");
}

TEST_CASE("First public non-builtin callable is the last resort", "[entry_point]")
{
    const std::vector<Symbol> symbols{
        data("LIMIT"), function("_private"), function("print", true), function("compute"),
        function("other")};
    REQUIRE(select_entry_point("", symbols, kFallbacks) == "compute");
}

TEST_CASE("Non-callable symbols are never selected", "[entry_point]")
{
    const std::vector<Symbol> symbols{data("solve"), data("two_sum")};
    REQUIRE_FALSE(select_entry_point("def two_sum():\n    pass\n", symbols, kFallbacks).has_value());
}

TEST_CASE("Resolver returns the selected symbol with its handle", "[entry_point]")
{
    const CandidateNamespace ns{std::vector<Symbol>{data("x"), function("_helper"), function("add")}};
    const EntryPointResolver resolver;

    const auto& symbol = resolver.resolve(std::string{"def add(a, b):\n    pass\n"}, ns);
    REQUIRE(symbol.name == "add");
    REQUIRE(symbol.handle != nullptr);

    REQUIRE(resolver.resolve(std::nullopt, ns).name == "add");
}

TEST_CASE("Resolver fails when nothing qualifies", "[entry_point]")
{
    const EntryPointResolver resolver;
    REQUIRE_THROWS_AS(resolver.resolve(std::nullopt, CandidateNamespace{}), EntryPointNotFoundError);

    const CandidateNamespace ns{
        std::vector<Symbol>{data("value"), function("_private"), function("len", true)}};
    try {
        (void)resolver.resolve(std::nullopt, ns);
        FAIL("expected EntryPointNotFoundError");
    } catch (const EntryPointNotFoundError& ex) {
        REQUIRE(std::string{ex.what()} == "Could not detect function to test");
    }
}

TEST_CASE("Custom fallback list replaces the default one", "[entry_point]")
{
    const CandidateNamespace ns{std::vector<Symbol>{function("solve"), function("answer")}};
    const EntryPointResolver resolver{EntryPointResolver::Config{{"answer"}}};
    REQUIRE(resolver.resolve(std::nullopt, ns).name == "answer");
}
