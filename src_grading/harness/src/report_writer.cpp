// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#include "cortex_grading/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json result_to_json(const cortex::grading::TestResult& result) {
    json entry = {
        {"id", result.id},
        {"input", result.input},
        {"expected", result.expected},
        {"explanation", result.explanation},
        {"passed", result.passed},
        {"output", result.output},
        {"error", optional_string(result.error)},
        {"execution_time_ms", result.execution_time_ms},
    };
    if (result.traceback) {
        entry["traceback"] = *result.traceback;
    }
    return entry;
}

std::string escape_html(const std::string& input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&':
                oss << "&amp;";
                break;
            case '<':
                oss << "&lt;";
                break;
            case '>':
                oss << "&gt;";
                break;
            case '"':
                oss << "&quot;";
                break;
            case '\'':
                oss << "&#39;";
                break;
            default:
                oss << ch;
        }
    }
    return oss.str();
}

std::string value_to_html(const json& value) {
    return "<code>" + escape_html(value.dump(-1, ' ', false, json::error_handler_t::replace)) +
           "</code>";
}

std::string render_html(const cortex::grading::RunReport& report) {
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>Grading Report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << "pre{margin:0;white-space:pre-wrap;}"
        << ".status-PASS{color:#0a7c2f;font-weight:bold;}"
        << ".status-FAIL{color:#c1121f;font-weight:bold;}"
        << ".status-ERROR{color:#b000b5;font-weight:bold;}"
        << "</style></head><body>";

    oss << "<h1>Grading Report</h1>";

    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Pipeline: " << (report.success ? "completed" : "failed") << "</li>";
    if (report.error) {
        oss << "<li class=\"status-ERROR\">Error: " << escape_html(*report.error) << "</li>";
    }
    oss << "<li>Total: " << report.total << "</li>";
    oss << "<li>Passed: " << report.passed << "</li>";
    oss << "<li>Failed: " << report.failed << "</li>";
    oss << "</ul></section>";

    if (report.results.empty()) {
        oss << "</body></html>";
        return oss.str();
    }

    oss << "<section><h2>Test cases</h2><table>";
    oss << "<thead><tr>"
        << "<th>#</th>"
        << "<th>Test</th>"
        << "<th>Status</th>"
        << "<th>Input</th>"
        << "<th>Expected</th>"
        << "<th>Output</th>"
        << "<th>Error</th>"
        << "<th>Time (ms)</th>"
        << "</tr></thead><tbody>";

    for (std::size_t index = 0; index < report.results.size(); ++index) {
        const auto& result = report.results[index];
        const std::string status = result.passed ? "PASS" : (result.error ? "ERROR" : "FAIL");

        oss << "<tr>";
        oss << "<td>" << (index + 1) << "</td>";
        oss << "<td>" << escape_html(result.id);
        if (!result.explanation.empty()) {
            oss << "<br/><small>" << escape_html(result.explanation) << "</small>";
        }
        oss << "</td>";
        oss << "<td class=\"status-" << status << "\">" << status << "</td>";
        oss << "<td>" << value_to_html(result.input) << "</td>";
        oss << "<td>" << value_to_html(result.expected) << "</td>";
        oss << "<td>" << value_to_html(result.output) << "</td>";
        oss << "<td>";
        if (result.error) {
            oss << escape_html(*result.error);
        }
        if (result.traceback) {
            oss << "<pre>" << escape_html(*result.traceback) << "</pre>";
        }
        oss << "</td>";
        oss << "<td>" << result.execution_time_ms << "</td>";
        oss << "</tr>";
    }

    oss << "</tbody></table></section>";
    oss << "</body></html>";
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace cortex::grading {

nlohmann::json ReportWriter::to_json(const RunReport& report) const {
    json results = json::array();
    for (const auto& result : report.results) {
        results.push_back(result_to_json(result));
    }

    return json{
        {"success", report.success},
        {"total", report.total},
        {"passed", report.passed},
        {"failed", report.failed},
        {"results", std::move(results)},
        {"error", optional_string(report.error)},
    };
}

void ReportWriter::write_json(std::ostream& output, const RunReport& report) const {
    // Candidate strings are not guaranteed to be valid UTF-8.
    output << to_json(report).dump(2, ' ', false, json::error_handler_t::replace) << '\n';
}

void ReportWriter::write_json(const std::filesystem::path& destination,
                              const RunReport& report) const {
    write_file(destination,
               to_json(report).dump(2, ' ', false, json::error_handler_t::replace) + "\n");
}

void ReportWriter::write_html(const std::filesystem::path& destination,
                              const RunReport& report) const {
    write_file(destination, render_html(report));
}

}  // namespace cortex::grading
