// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#include "cortex_grading/problem_loader.hpp"
#include "cortex_grading/errors.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

using cortex::grading::ComparisonMode;
using cortex::grading::ParseError;
using cortex::grading::Value;

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

bool is_quoted_or_str_tagged(const YAML::Node& node) {
    const auto& tag = node.Tag();
    return tag == "!" || tag == "tag:yaml.org,2002:str";
}

// Magnitude written in `base` as canonical decimal text, without the 64-bit limit.
std::string to_decimal_digits(std::string_view digits, int base) {
    std::vector<int> decimal{0};  // least significant digit first
    for (char ch : digits) {
        const auto code = static_cast<unsigned char>(ch);
        int carry = std::isdigit(code) ? ch - '0' : std::tolower(code) - 'a' + 10;
        for (auto& place : decimal) {
            const int value = place * base + carry;
            place = value % 10;
            carry = value / 10;
        }
        while (carry > 0) {
            decimal.push_back(carry % 10);
            carry /= 10;
        }
    }
    while (decimal.size() > 1 && decimal.back() == 0) {
        decimal.pop_back();
    }

    std::string text;
    text.reserve(decimal.size());
    for (auto it = decimal.rbegin(); it != decimal.rend(); ++it) {
        text.push_back(static_cast<char>('0' + *it));
    }
    return text;
}

std::optional<Value> parse_integer(std::string_view text) {
    bool negative = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        text.remove_prefix(2);
    } else if (text.size() > 2 && text[0] == '0' && (text[1] == 'o' || text[1] == 'O')) {
        base = 8;
        text.remove_prefix(2);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    std::uint64_t magnitude = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, magnitude, base);
    if (ptr != last) {
        return std::nullopt;
    }
    if (ec == std::errc::result_out_of_range) {
        return cortex::grading::make_big_integer((negative ? "-" : "") +
                                                 to_decimal_digits(text, base));
    }
    if (ec != std::errc{}) {
        return std::nullopt;
    }

    if (!negative) {
        if (magnitude <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Value(static_cast<std::int64_t>(magnitude));
        }
        return Value(magnitude);
    }
    constexpr auto kMinMagnitude =
        static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1;
    if (magnitude > kMinMagnitude) {
        return cortex::grading::make_big_integer("-" + to_decimal_digits(text, base));
    }
    if (magnitude == kMinMagnitude) {
        return Value(std::numeric_limits<std::int64_t>::min());
    }
    return Value(-static_cast<std::int64_t>(magnitude));
}

// YAML 1.2 core schema float: [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)? plus .inf/.nan
std::optional<Value> parse_float(std::string_view text) {
    static constexpr std::string_view kInfForms[] = {".inf", ".Inf", ".INF"};
    static constexpr std::string_view kNanForms[] = {".nan", ".NaN", ".NAN"};

    for (auto form : kNanForms) {
        if (text == form) {
            return Value(std::numeric_limits<double>::quiet_NaN());
        }
    }

    bool negative = false;
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    for (auto form : kInfForms) {
        if (text == form) {
            const double inf = std::numeric_limits<double>::infinity();
            return Value(negative ? -inf : inf);
        }
    }

    if (text.empty() || !(std::isdigit(static_cast<unsigned char>(text.front())) || text.front() == '.')) {
        return std::nullopt;
    }
    if (text.size() > 1 && (text[1] == 'x' || text[1] == 'X')) {
        return std::nullopt;
    }

    double parsed = 0.0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, parsed, std::chars_format::general);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return Value(negative ? -parsed : parsed);
}

Value scalar_to_value(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (is_quoted_or_str_tagged(node)) {
        return Value(text);
    }

    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return Value(nullptr);
    }
    const auto lowered = to_lower_copy(text);
    if (lowered == "true") {
        return Value(true);
    }
    if (lowered == "false") {
        return Value(false);
    }
    if (auto integer = parse_integer(text)) {
        return std::move(*integer);
    }
    if (auto floating = parse_float(text)) {
        return std::move(*floating);
    }
    return Value(text);
}

Value to_value(const YAML::Node& node, const std::filesystem::path& file) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return Value(nullptr);
        case YAML::NodeType::Scalar:
            return scalar_to_value(node);
        case YAML::NodeType::Sequence: {
            Value array = Value::array();
            for (const auto& element : node) {
                array.push_back(to_value(element, file));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            Value object = Value::object();
            for (const auto& entry : node) {
                if (!entry.first.IsScalar()) {
                    throw ParseError("Non-scalar mapping key at " + file.string() + ":" +
                                     std::to_string(entry.first.Mark().line + 1));
                }
                object[entry.first.Scalar()] = to_value(entry.second, file);
            }
            return object;
        }
    }
    return Value(nullptr);
}

std::optional<std::string> optional_text(const YAML::Node& parent, const char* key) {
    const auto node = parent[key];
    if (!node || node.IsNull() || !node.IsScalar()) {
        return std::nullopt;
    }
    return node.Scalar();
}

ComparisonMode comparison_of(const YAML::Node& node,
                             const std::filesystem::path& file) {
    const auto mode = node.IsScalar()
        ? cortex::grading::parse_comparison_mode(node.Scalar())
        : std::nullopt;
    if (!mode) {
        throw ParseError("Unknown comparison mode at " + file.string() + ":" +
                         std::to_string(node.Mark().line + 1) + " (expected 'ordered' or 'unordered')");
    }
    return *mode;
}

cortex::grading::TestCase parse_test_case(const YAML::Node& node,
                                          const std::filesystem::path& file,
                                          std::size_t index) {
    if (!node.IsMap()) {
        throw ParseError("Test case #" + std::to_string(index + 1) + " is not a mapping in " +
                         file.string());
    }

    cortex::grading::TestCase test_case;

    if (const auto id = node["id"]; id && !id.IsNull()) {
        test_case.id = id.IsScalar() ? id.Scalar() : to_value(id, file).dump();
    }
    if (const auto input = node["input"]) {
        test_case.input = to_value(input, file);
    }
    if (const auto expected = node["expected"]) {
        test_case.expected = to_value(expected, file);
    }
    if (auto explanation = optional_text(node, "explanation")) {
        test_case.explanation = std::move(*explanation);
    }
    if (const auto comparison = node["comparison"]; comparison && !comparison.IsNull()) {
        test_case.comparison = comparison_of(comparison, file);
    }
    return test_case;
}

}  // namespace

namespace cortex::grading {

std::string_view to_string(ComparisonMode mode) noexcept {
    switch (mode) {
        case ComparisonMode::Ordered:
            return "ordered";
        case ComparisonMode::Unordered:
            return "unordered";
    }
    return "ordered";
}

std::optional<ComparisonMode> parse_comparison_mode(std::string_view text) {
    const auto lowered = to_lower_copy(text);
    if (lowered == "ordered") {
        return ComparisonMode::Ordered;
    }
    if (lowered == "unordered") {
        return ComparisonMode::Unordered;
    }
    return std::nullopt;
}

ProblemSpec ProblemLoader::load(const std::filesystem::path& directory) const {
    if (std::filesystem::is_regular_file(directory)) {
        return load_file(directory);
    }
    return load_file(directory / kDefinitionFile);
}

ProblemSpec ProblemLoader::load_file(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw NotFoundError("Problem file not found: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw NotFoundError("Problem path is not a regular file: " + file.string());
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(file.string());
    } catch (const YAML::BadFile&) {
        throw NotFoundError("Unable to open problem file: " + file.string());
    } catch (const YAML::Exception& ex) {
        throw ParseError(file.string() + ": " + ex.what());
    }

    if (root.IsNull()) {
        throw NoTestCasesError{};
    }
    if (!root.IsMap()) {
        throw ParseError("Problem definition root is not a mapping: " + file.string());
    }

    ProblemSpec spec;
    spec.source_file = file.string();
    spec.id = optional_text(root, "id").value_or(file.parent_path().filename().string());
    spec.title = optional_text(root, "title").value_or(spec.id);
    spec.entry_point_hint = optional_text(root, "starter_code_python");

    if (const auto comparison = root["comparison"]; comparison && !comparison.IsNull()) {
        spec.comparison = comparison_of(comparison, file);
    }

    const auto test_cases = root["test_cases"];
    if (!test_cases || test_cases.IsNull()) {
        throw NoTestCasesError{};
    }
    if (!test_cases.IsSequence()) {
        throw ParseError("'test_cases' is not a sequence in " + file.string());
    }

    try {
        spec.test_cases.reserve(test_cases.size());
        for (std::size_t index = 0; index < test_cases.size(); ++index) {
            spec.test_cases.push_back(parse_test_case(test_cases[index], file, index));
        }
    } catch (const YAML::Exception& ex) {
        throw ParseError(file.string() + ": " + ex.what());
    }

    if (spec.test_cases.empty()) {
        throw NoTestCasesError{};
    }

    spdlog::debug("loaded problem '{}' with {} test case(s) from {}",
                  spec.id, spec.test_cases.size(), spec.source_file);
    return spec;
}

}  // namespace cortex::grading
