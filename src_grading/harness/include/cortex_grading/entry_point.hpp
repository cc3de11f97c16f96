// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "candidate.hpp"

namespace cortex::grading {

/// Function names declared by `def` lines of starter code, in line order.
[[nodiscard]] std::vector<std::string> hinted_function_names(std::string_view starter_code);

/**
 * \brief Heuristic, order-sensitive entry point selection.
 *
 * First match wins:
 *  1. a callable named by a `def` line of the starter code;
 *  2. the first callable among fallback_names, in list order;
 *  3. the first callable in namespace order that is neither `_`-prefixed nor a built-in.
 *
 * Problems are authored so that exactly one plausible entry point exists; ambiguity is not
 * resolved any more cleverly than this.
 */
[[nodiscard]] std::optional<std::string> select_entry_point(
    std::string_view starter_code,
    const std::vector<Symbol>& symbols,
    const std::vector<std::string>& fallback_names);

class EntryPointResolver {
public:
    struct Config {
        std::vector<std::string> fallback_names{
            "solve", "solution", "main", "find_asteroid_pair", "find_top_k_pairs"};
    };

    EntryPointResolver() = default;
    explicit EntryPointResolver(Config config);

    /// Throws EntryPointNotFoundError when nothing qualifies.
    [[nodiscard]] const Symbol& resolve(const std::optional<std::string>& hint,
                                        const CandidateNamespace& ns) const;

private:
    Config config_{};
};

}  // namespace cortex::grading
