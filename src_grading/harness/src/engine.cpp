// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#include "cortex_grading/engine.hpp"
#include "cortex_grading/comparator.hpp"
#include "cortex_grading/errors.hpp"

#include <cmath>
#include <string>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

using cortex::grading::ComparisonMode;
using cortex::grading::RunReport;
using cortex::grading::RunStage;

double round_to_hundredths(double milliseconds) {
    return std::round(milliseconds * 100.0) / 100.0;
}

RunReport failed_report(std::string error) {
    RunReport report;
    report.success = false;
    report.error = std::move(error);
    return report;
}

}  // namespace

namespace cortex::grading {

std::string_view to_string(RunStage stage) noexcept {
    switch (stage) {
        case RunStage::Init:
            return "Init";
        case RunStage::ProblemLoaded:
            return "ProblemLoaded";
        case RunStage::CandidateLoaded:
            return "CandidateLoaded";
        case RunStage::EntryResolved:
            return "EntryResolved";
        case RunStage::Running:
            return "Running";
        case RunStage::Done:
            return "Done";
        case RunStage::Failed:
            return "Failed";
    }
    return "Unknown";
}

Engine::Engine(Config config, const CandidateLoader& candidate_loader)
    : config_{std::move(config)},
      candidate_loader_{candidate_loader},
      resolver_{EntryPointResolver::Config{config_.fallback_names}},
      executor_{SandboxedExecutor::Config{
          .deadline = config_.deadline,
          .memory_limit_bytes = config_.memory_limit_bytes,
      }} {}

RunReport Engine::run(const std::filesystem::path& problem_dir,
                      const std::filesystem::path& candidate_source) const {
    RunStage stage = RunStage::Init;
    auto advance = [&stage](RunStage next) {
        spdlog::debug("stage {} -> {}", to_string(stage), to_string(next));
        stage = next;
    };
    auto fail = [&](std::string reason) {
        spdlog::warn("grading failed in stage {}: {}", to_string(stage), reason);
        advance(RunStage::Failed);
        return failed_report(std::move(reason));
    };

    try {
        const auto problem = problem_loader_.load(problem_dir);
        advance(RunStage::ProblemLoaded);

        const auto candidate = candidate_loader_.load(candidate_source);
        advance(RunStage::CandidateLoaded);

        const auto& entry_point = resolver_.resolve(problem.entry_point_hint, candidate);
        advance(RunStage::EntryResolved);

        RunReport report;
        report.total = problem.test_cases.size();
        report.results.reserve(problem.test_cases.size());
        advance(RunStage::Running);

        for (std::size_t index = 0; index < problem.test_cases.size(); ++index) {
            const auto& test_case = problem.test_cases[index];
            const auto mode = config_.comparison_override.value_or(
                test_case.comparison.value_or(problem.comparison));

            auto result = grade(*entry_point.handle, test_case, mode);
            spdlog::debug("test {} [{}]: {}", index, result.id,
                          result.passed ? "passed" : result.error.value_or("wrong answer"));
            if (result.passed) {
                ++report.passed;
            } else {
                ++report.failed;
            }
            report.results.push_back(std::move(result));
        }

        report.success = true;
        advance(RunStage::Done);
        spdlog::info("{}: {}/{} test(s) passed", problem.id, report.passed, report.total);
        return report;
    } catch (const CandidateSyntaxError& ex) {
        return fail(std::string{"Syntax Error: "} + ex.what());
    } catch (const NoTestCasesError& ex) {
        return fail(ex.what());
    } catch (const ParseError& ex) {
        return fail(std::string{"Invalid problem definition: "} + ex.what());
    } catch (const GradingError& ex) {
        return fail(ex.what());
    } catch (const std::exception& ex) {
        spdlog::error("unexpected failure while grading {}: {}", candidate_source.string(),
                      ex.what());
        return fail(std::string{"Unexpected error: "} + ex.what());
    }
}

TestResult Engine::grade(const Invocable& entry_point,
                         const TestCase& test_case,
                         ComparisonMode mode) const {
    TestResult result;
    result.id = test_case.id;
    result.input = test_case.input;
    result.expected = test_case.expected;
    result.explanation = test_case.explanation;

    ExecutionOutcome outcome;
    try {
        outcome = executor_.execute(entry_point, test_case.input);
    } catch (const std::system_error& ex) {
        spdlog::error("executor failure on test '{}': {}", test_case.id, ex.what());
        result.error = std::string{"ExecutionError: "} + ex.what();
        return result;
    }

    result.execution_time_ms = round_to_hundredths(outcome.elapsed_ms);
    if (!outcome.returned()) {
        result.error = outcome.describe_fault();
        if (!outcome.traceback.empty()) {
            result.traceback = outcome.traceback;
        }
        return result;
    }

    result.output = std::move(outcome.output);
    result.passed = outputs_match(result.output, test_case.expected, mode);
    return result;
}

}  // namespace cortex::grading
