// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "value.hpp"

namespace cortex::grading {

/**
 * \brief How a candidate's sequence output is matched against the expected one.
 *
 * Ordered is element-wise. Unordered treats the top-level sequences as multisets, for problems
 * whose answer is semantically order independent ("find all valid paths").
 */
enum class ComparisonMode {
    Ordered,
    Unordered,
};

[[nodiscard]] std::string_view to_string(ComparisonMode mode) noexcept;

/// Returns std::nullopt for anything but `ordered` / `unordered` (case-insensitive).
[[nodiscard]] std::optional<ComparisonMode> parse_comparison_mode(std::string_view text);

/**
 * \brief One declared test case.
 *
 * `explanation` is display only and never affects grading.
 */
struct TestCase {
    std::string id{"unknown"};
    Value input = Value::object();
    Value expected{};
    std::string explanation;
    std::optional<ComparisonMode> comparison;  ///< Overrides ProblemSpec::comparison
};

/**
 * \brief In-memory problem definition, loaded once per run.
 *
 * Invariant: test_cases is never empty (an empty definition fails to load).
 */
struct ProblemSpec {
    std::string source_file;
    std::string id;
    std::string title;
    std::vector<TestCase> test_cases;               ///< Report order equals this order
    std::optional<std::string> entry_point_hint;    ///< Starter code naming the expected function
    ComparisonMode comparison{ComparisonMode::Ordered};
};

}  // namespace cortex::grading
