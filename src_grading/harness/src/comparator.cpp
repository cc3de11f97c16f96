// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#include "cortex_grading/comparator.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <system_error>
#include <vector>

namespace {

using cortex::grading::Value;

// Value's operator< orders numbers numerically and everything else by type then content,
// which is all a multiset comparison needs.
bool same_multiset(std::vector<Value> lhs, std::vector<Value> rhs) {
    std::sort(lhs.begin(), lhs.end());
    std::sort(rhs.begin(), rhs.end());
    return lhs == rhs;
}

}  // namespace

namespace cortex::grading {

double round_to_digits(double value, int digits) {
    if (!std::isfinite(value)) {
        return value;
    }

    // Largest finite double in fixed notation needs 309 integral digits.
    std::array<char, 512> buffer{};
    const auto written = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                       std::chars_format::fixed, digits);
    if (written.ec != std::errc{}) {
        return value;
    }

    double rounded = value;
    const auto parsed = std::from_chars(buffer.data(), written.ptr, rounded);
    if (parsed.ec != std::errc{}) {
        return value;
    }
    // -0.000000 parses back as -0.0
    return rounded == 0.0 ? 0.0 : rounded;
}

Value normalize(const Value& value) {
    if (value.is_array()) {
        Value normalized = Value::array();
        for (const auto& element : value) {
            normalized.push_back(normalize(element));
        }
        return normalized;
    }
    if (value.is_number_float()) {
        return Value(round_to_digits(value.get<double>(), kFloatComparisonDigits));
    }
    if (value.is_object()) {
        Value normalized = Value::object();
        for (const auto& [key, element] : value.items()) {
            normalized[key] = normalize(element);
        }
        return normalized;
    }
    return value;
}

bool outputs_match(const Value& actual, const Value& expected, ComparisonMode mode) {
    if (expected.is_null()) {
        return actual.is_null();
    }

    const auto normalized_actual = normalize(actual);
    const auto normalized_expected = normalize(expected);

    if (normalized_actual.is_array() && normalized_expected.is_array()) {
        if (normalized_actual.size() != normalized_expected.size()) {
            return false;
        }
        if (mode == ComparisonMode::Unordered) {
            return same_multiset(normalized_actual.get<std::vector<Value>>(),
                                 normalized_expected.get<std::vector<Value>>());
        }
    }

    return normalized_actual == normalized_expected;
}

}  // namespace cortex::grading
