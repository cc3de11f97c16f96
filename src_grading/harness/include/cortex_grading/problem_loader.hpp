// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#pragma once

#include "problem.hpp"

#include <filesystem>

namespace cortex::grading {

/**
 * \brief Loads a problem definition (`problem.yaml`) from disk.
 *
 * Recognised keys:
 *   - `test_cases`: Required, non-empty sequence of mappings with `id`, `input`, `expected`,
 *                   `explanation` and an optional `comparison`.
 *   - `starter_code_python`: Optional starter code; its `def` lines hint the entry point.
 *   - `comparison`: Optional `ordered` (default) or `unordered`.
 *   - `id`, `title`: Optional, informational.
 *
 * Example:
 * \code{.yaml}
 * id: two-sum
 * starter_code_python: |
 *   def add(a, b):
 *       pass
 * test_cases:
 *   - id: basic
 *     input: {a: 1, b: 2}
 *     expected: 3
 * \endcode
 *
 * All other keys (description, hints, examples...) are pedagogical payload and are ignored.
 * Scalars are typed with the YAML core schema; quoted scalars always stay strings and integers
 * beyond 64 bits become tagged big integers (see make_big_integer).
 *
 * Throws NotFoundError when the file is absent, ParseError when it cannot be deserialized and
 * NoTestCasesError when it declares no test case.
 */
class ProblemLoader {
public:
    static constexpr const char* kDefinitionFile = "problem.yaml";

    ProblemLoader() = default;

    /// Loads `<directory>/problem.yaml`; a path to a regular file is loaded as is.
    [[nodiscard]] ProblemSpec load(const std::filesystem::path& directory) const;

    [[nodiscard]] ProblemSpec load_file(const std::filesystem::path& file) const;
};

}  // namespace cortex::grading
