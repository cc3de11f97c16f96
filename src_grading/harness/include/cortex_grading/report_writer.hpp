// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#pragma once

#include "engine.hpp"

#include <filesystem>
#include <ostream>

#include <nlohmann/json.hpp>

namespace cortex::grading {

/**
 * \brief Emits machine-readable and human-friendly reports for grading runs.
 *
 * - to_json() / write_json(): The run report consumed by automation. Field names are fixed:
 *   `success, total, passed, failed, results[], error`, and per result
 *   `id, input, expected, explanation, passed, output, error, execution_time_ms` plus
 *   `traceback` when the candidate raised.
 * - write_html(): A tabular view of the same data.
 */
class ReportWriter {
public:
    ReportWriter() = default;

    [[nodiscard]] nlohmann::json to_json(const RunReport& report) const;

    void write_json(std::ostream& output, const RunReport& report) const;

    void write_json(const std::filesystem::path& destination, const RunReport& report) const;

    void write_html(const std::filesystem::path& destination, const RunReport& report) const;
};

}  // namespace cortex::grading
