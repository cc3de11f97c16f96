// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#pragma once

#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace cortex::grading {

/**
 * \brief Dynamically typed value exchanged with candidate code.
 *
 * Test inputs, expected outputs and candidate return values all live in this domain:
 * null, boolean, integer, float, string, ordered sequence and string-keyed mapping.
 *
 * Integers outside the 64-bit range are carried losslessly as a single-key mapping
 * `{"$bigint": "<decimal digits>"}` (canonical: optional '-', no leading zeros). Problem
 * definitions and language bridges both produce this form, so it only ever equals itself.
 */
using Value = nlohmann::json;

inline constexpr const char* kBigIntegerKey = "$bigint";

[[nodiscard]] inline Value make_big_integer(std::string decimal_digits) {
    Value tagged = Value::object();
    tagged[kBigIntegerKey] = std::move(decimal_digits);
    return tagged;
}

[[nodiscard]] inline bool is_big_integer(const Value& value) {
    if (!value.is_object() || value.size() != 1) {
        return false;
    }
    const auto it = value.find(kBigIntegerKey);
    return it != value.end() && it->is_string();
}

}  // namespace cortex::grading
