// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#include "cortex_grading/candidate.hpp"

#include <algorithm>

namespace cortex::grading {

const Symbol* CandidateNamespace::find(const std::string& name) const noexcept {
    const auto it = std::find_if(symbols_.begin(), symbols_.end(),
                                 [&](const Symbol& symbol) { return symbol.name == name; });
    return it == symbols_.end() ? nullptr : &*it;
}

}  // namespace cortex::grading
