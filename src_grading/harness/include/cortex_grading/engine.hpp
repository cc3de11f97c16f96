// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "candidate.hpp"
#include "entry_point.hpp"
#include "executor.hpp"
#include "problem.hpp"
#include "problem_loader.hpp"
#include "value.hpp"

namespace cortex::grading {

struct TestResult {
    std::string id;
    Value input;
    Value expected;
    std::string explanation;
    bool passed{false};
    Value output{};                        ///< null when execution produced nothing usable
    std::optional<std::string> error;      ///< Per-test fault, null on success or plain mismatch
    std::optional<std::string> traceback;  ///< Candidate traceback when it raised
    double execution_time_ms{0.0};
};

/**
 * \brief Outcome of one run.
 *
 * `success` only says the pipeline completed (problem loaded, candidate loaded, entry point
 * found). When it is false, `error` holds the reason and `results` is empty.
 */
struct RunReport {
    bool success{false};
    std::size_t total{0};
    std::size_t passed{0};
    std::size_t failed{0};
    std::vector<TestResult> results;
    std::optional<std::string> error;

    /// The process exit signal: pipeline completed and no test failed.
    [[nodiscard]] bool all_passed() const noexcept { return success && failed == 0; }
};

enum class RunStage {
    Init,
    ProblemLoaded,
    CandidateLoaded,
    EntryResolved,
    Running,
    Done,
    Failed,
};

[[nodiscard]] std::string_view to_string(RunStage stage) noexcept;

/**
 * \brief Grades one candidate against one problem.
 *
 * Init -> ProblemLoaded -> CandidateLoaded -> EntryResolved -> Running(i) -> Done, with any
 * load or resolution fault short-circuiting to Failed. Test cases run sequentially in declared
 * order; a fault in one test case is recorded in its TestResult and never stops the run.
 */
class Engine {
public:
    struct Config {
        std::chrono::milliseconds deadline{std::chrono::seconds{2}};
        std::optional<std::uint64_t> memory_limit_bytes{};
        std::vector<std::string> fallback_names{EntryPointResolver::Config{}.fallback_names};
        std::optional<ComparisonMode> comparison_override{};  ///< Beats problem and test case
    };

    Engine(Config config, const CandidateLoader& candidate_loader);

    [[nodiscard]] RunReport run(const std::filesystem::path& problem_dir,
                                const std::filesystem::path& candidate_source) const;

    /// Runs and compares a single test case against an already resolved entry point.
    [[nodiscard]] TestResult grade(const Invocable& entry_point,
                                   const TestCase& test_case,
                                   ComparisonMode mode) const;

private:
    Config config_;
    const CandidateLoader& candidate_loader_;
    ProblemLoader problem_loader_;
    EntryPointResolver resolver_;
    SandboxedExecutor executor_;
};

}  // namespace cortex::grading
