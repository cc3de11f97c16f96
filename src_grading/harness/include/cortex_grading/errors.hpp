// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace cortex::grading {

/**
 * \brief Root of the pipeline-halting faults.
 *
 * Anything derived from GradingError that escapes a loader or the resolver ends the run with
 * `success=false` and no test results.
 */
class GradingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Problem definition or candidate source does not exist.
class NotFoundError : public GradingError {
public:
    using GradingError::GradingError;
};

/// Problem definition cannot be deserialized into a ProblemSpec.
class ParseError : public GradingError {
public:
    using GradingError::GradingError;
};

/// Problem definition declares no test cases.
class NoTestCasesError : public ParseError {
public:
    NoTestCasesError() : ParseError("No test cases found in problem definition") {}
};

/// Candidate source text is not valid source. what() carries the interpreter diagnostic.
class CandidateSyntaxError : public GradingError {
public:
    using GradingError::GradingError;
};

/// Candidate top-level code raised while being executed.
class CandidateLoadError : public GradingError {
public:
    using GradingError::GradingError;
};

class EntryPointNotFoundError : public GradingError {
public:
    EntryPointNotFoundError() : GradingError("Could not detect function to test") {}
};

/**
 * \brief Fault raised by candidate code during one invocation.
 *
 * Thrown by Invocable implementations inside the executor worker and converted to data there;
 * it never reaches the Engine.
 */
class CandidateFault : public std::runtime_error {
public:
    CandidateFault(std::string kind, const std::string& message, std::string traceback = {})
        : std::runtime_error(message), kind_{std::move(kind)}, traceback_{std::move(traceback)} {}

    [[nodiscard]] const std::string& kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& traceback() const noexcept { return traceback_; }

private:
    std::string kind_;
    std::string traceback_;
};

}  // namespace cortex::grading
