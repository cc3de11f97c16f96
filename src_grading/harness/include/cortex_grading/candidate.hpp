// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "value.hpp"

namespace cortex::grading {

/**
 * \brief Handle to one callable exported by a candidate.
 *
 * invoke() runs inside the executor's worker process. It receives the test case input (normally
 * an object of keyword arguments) and returns the candidate's result, or throws CandidateFault
 * when the candidate raised.
 *
 * The fork hooks let an implementation keep an embedded runtime consistent across fork(); they
 * are called by the executor in the parent before/after fork() and in the child right after it.
 */
class Invocable {
public:
    virtual ~Invocable() = default;

    [[nodiscard]] virtual Value invoke(const Value& arguments) const = 0;

    virtual void before_fork() const {}
    virtual void after_fork_parent() const {}
    virtual void after_fork_child() const {}
    /// Called in the child after invoke() returned or threw, before the result is reported.
    virtual void flush_output() const {}
};

struct Symbol {
    std::string name;
    bool callable{false};
    bool builtin{false};  ///< Name shadows a built-in primitive of the candidate's runtime
    std::shared_ptr<const Invocable> handle;  ///< Null unless callable
};

/**
 * \brief Top-level symbols of one loaded candidate, in definition order.
 *
 * Built once per run and exclusively owned by it. The grading engine only reads it; keep_alive
 * pins whatever runtime state the handles depend on (e.g. the candidate's globals).
 */
class CandidateNamespace {
public:
    CandidateNamespace() = default;
    explicit CandidateNamespace(std::vector<Symbol> symbols,
                                std::shared_ptr<const void> keep_alive = {})
        : symbols_{std::move(symbols)}, keep_alive_{std::move(keep_alive)} {}

    [[nodiscard]] const std::vector<Symbol>& symbols() const noexcept { return symbols_; }

    /// nullptr when no symbol has this name.
    [[nodiscard]] const Symbol* find(const std::string& name) const noexcept;

    [[nodiscard]] bool empty() const noexcept { return symbols_.empty(); }

private:
    std::vector<Symbol> symbols_;
    std::shared_ptr<const void> keep_alive_;
};

/**
 * \brief Turns candidate source text into a CandidateNamespace.
 *
 * Implementations throw NotFoundError, CandidateSyntaxError or CandidateLoadError.
 */
class CandidateLoader {
public:
    virtual ~CandidateLoader() = default;

    [[nodiscard]] virtual CandidateNamespace load(const std::filesystem::path& source) const = 0;
};

}  // namespace cortex::grading
