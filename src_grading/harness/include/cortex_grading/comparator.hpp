// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#pragma once

#include "problem.hpp"
#include "value.hpp"

namespace cortex::grading {

/// Decimal digits floats are rounded to before comparison.
inline constexpr int kFloatComparisonDigits = 6;

/// Correctly rounded decimal rounding; non-finite values are returned unchanged.
[[nodiscard]] double round_to_digits(double value, int digits);

/**
 * \brief Canonical form used for comparison.
 *
 * Sequences normalize element-wise, floats round to kFloatComparisonDigits, mappings normalize
 * value-wise with keys preserved; every other value passes through.
 */
[[nodiscard]] Value normalize(const Value& value);

/**
 * \brief Pass/fail decision for one test case.
 *
 * - expected null: actual must be null;
 * - both sequences: lengths must match, then elements must (Ordered: pairwise; Unordered: as
 *   multisets of normalized elements);
 * - otherwise structural equality of the normalized values. Integers and floats compare
 *   numerically, booleans never equal numbers.
 */
[[nodiscard]] bool outputs_match(const Value& actual,
                                 const Value& expected,
                                 ComparisonMode mode = ComparisonMode::Ordered);

}  // namespace cortex::grading
