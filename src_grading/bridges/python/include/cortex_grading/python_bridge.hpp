// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "cortex_grading/candidate.hpp"

namespace cortex::grading::python_bridge
{

/**
 * Embedded CPython session.
 *
 * The interpreter is started once per process and stays alive until exit; every Session after
 * the first one attaches to it. All Python work happens on the thread that called init(), which
 * keeps holding the GIL.
 *
 * Candidates never run in the grading process beyond their top-level statements: invocations go
 * through SandboxedExecutor, which forks a worker per call (see PythonCallable's fork hooks).
 */
class Session
{
public:
    struct Config
    {
        // Program name reported to the interpreter (sys.argv[0] / sys.executable lookup).
        std::string program_name{"cortex_grader"};

        // Extra entries prepended to sys.path (e.g. a directory of helper modules).
        std::vector<std::filesystem::path> module_paths;

        // Isolated mode ignores PYTHON* environment variables and the user site directory.
        bool isolated{true};
    };

    explicit Session(Config cfg);

    // Returns true when the interpreter is up and the session may load candidates.
    [[nodiscard]] bool initialized() const noexcept { return ready_; }

    /**
     * Start (or attach to) the interpreter and extend sys.path.
     * Returns true on success. Diagnostics appended to diag_out.
     */
    bool init(std::string& diag_out);

private:
    Config cfg_;
    bool ready_{false};
};

/**
 * Candidate loader for Python solutions.
 *
 * Compiles the source, executes it once in a fresh globals dict seeded only with __builtins__,
 * and exposes the resulting globals (in definition order) as a CandidateNamespace.
 *
 * Errors:
 *  - NotFoundError: source file missing or unreadable
 *  - CandidateSyntaxError: SyntaxError (incl. IndentationError) at compile or top-level run time
 *  - CandidateLoadError: any other exception raised by top-level code
 */
class SolutionLoader final : public ::cortex::grading::CandidateLoader
{
public:
    explicit SolutionLoader(const Session& session);

    [[nodiscard]] CandidateNamespace load(const std::filesystem::path& source) const override;

private:
    const Session& session_;
};

} // namespace cortex::grading::python_bridge
